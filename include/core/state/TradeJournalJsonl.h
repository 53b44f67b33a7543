#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/ITradeJournal.h"

namespace signaldesk {
namespace core {

class TradeJournalJsonl : public ITradeJournal {
public:
    explicit TradeJournalJsonl(std::filesystem::path file_path);

    bool append(const TradeEvent& event) override;
    std::vector<TradeEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }

    static std::string toString(TradeEventType type);
    // 알 수 없는 값이면 false
    static bool parseType(const std::string& value, TradeEventType& out);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace signaldesk
