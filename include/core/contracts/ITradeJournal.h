#pragma once

#include <cstdint>
#include <vector>

#include "core/model/JournalTypes.h"

namespace signaldesk {
namespace core {

// Append-only trade event log. 기록된 이벤트는 수정/삭제되지 않는다
class ITradeJournal {
public:
    virtual ~ITradeJournal() = default;

    // false 면 기록되지 않음 (호출자가 상태 전이를 중단해야 함)
    virtual bool append(const TradeEvent& event) = 0;
    virtual std::vector<TradeEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace signaldesk
