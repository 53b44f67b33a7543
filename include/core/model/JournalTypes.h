#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace signaldesk {
namespace core {

enum class TradeEventType {
    TRADE_OPENED,
    TRADE_CLOSED
};

// 저널 한 줄. payload 는 해당 시점의 Trade 전체 레코드
struct TradeEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    TradeEventType type = TradeEventType::TRADE_OPENED;
    std::string symbol;
    std::string trade_id;
    nlohmann::json payload;
};

} // namespace core
} // namespace signaldesk
