#pragma once

#include "common/InstrumentClass.h"
#include "common/Types.h"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace signaldesk {
namespace engine {

// 확인된 신호로부터 만들어진 거래. PositionLedger 만 상태를 바꾼다
struct Trade {
    std::string id;
    std::string signal_id;
    std::string symbol;
    Direction direction;
    TradingMode mode;
    common::InstrumentClass instrument;
    std::string strategy;

    double entry_price;             // 확인 시점의 실시간 가격
    double quantity;
    double stop_loss;
    double take_profit;             // TP1
    std::optional<double> take_profit_2;

    TradeStatus status;
    long long created_at;           // ms

    // CLOSED 전이 때 한 번에 채워진다
    std::optional<double> exit_price;
    std::optional<double> pnl;
    std::optional<long long> closed_at;
    std::optional<CloseReason> close_reason;

    Trade()
        : direction(Direction::BUY)
        , mode(TradingMode::INTRADAY)
        , instrument(common::InstrumentClass::CRYPTO)
        , entry_price(0.0)
        , quantity(0.0)
        , stop_loss(0.0)
        , take_profit(0.0)
        , status(TradeStatus::OPEN)
        , created_at(0)
    {}

    bool isOpen() const { return status == TradeStatus::OPEN; }

    // (price - entry) x qty x sign
    double pnlAt(double price) const {
        return (price - entry_price) * quantity * directionSign(direction);
    }
};

nlohmann::json toJson(const Trade& trade);

// Throws InvalidArgumentError on missing or malformed fields.
Trade tradeFromJson(const nlohmann::json& j);

} // namespace engine
} // namespace signaldesk
