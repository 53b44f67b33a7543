#include "core/state/TradeJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace signaldesk {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

TradeJournalJsonl::TradeJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception&) {
            // 깨진 줄은 건너뛰고 계속 스캔
        }
    }
}

bool TradeJournalJsonl::append(const TradeEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Journal directory create failed: {} ({})", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal open failed: {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["symbol"] = event.symbol;
    line["trade_id"] = event.trade_id;
    line["payload"] = event.payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out.good()) {
        LOG_ERROR("Journal write failed: {}", file_path_.string());
        return false;
    }

    last_seq_ = next_seq;
    return true;
}

std::vector<TradeEvent> TradeJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TradeEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    size_t skipped = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::parse_error&) {
            ++skipped;
            continue;
        }

        TradeEvent event;
        try {
            event.seq = parseSeq(line);
            if (event.seq < seq_inclusive) {
                continue;
            }
            if (!parseType(line.value("type", std::string()), event.type)) {
                ++skipped;
                continue;
            }
            event.ts_ms = line.value("ts_ms", 0LL);
            event.symbol = line.value("symbol", std::string());
            event.trade_id = line.value("trade_id", std::string());
            event.payload = line.value("payload", nlohmann::json::object());
        } catch (const nlohmann::json::type_error&) {
            ++skipped;
            continue;
        }
        out.push_back(std::move(event));
    }

    if (skipped > 0) {
        LOG_WARN("Journal {}: skipped {} malformed line(s)", file_path_.string(), skipped);
    }
    return out;
}

std::uint64_t TradeJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string TradeJournalJsonl::toString(TradeEventType type) {
    switch (type) {
        case TradeEventType::TRADE_OPENED: return "TRADE_OPENED";
        case TradeEventType::TRADE_CLOSED: return "TRADE_CLOSED";
    }
    return "TRADE_OPENED";
}

bool TradeJournalJsonl::parseType(const std::string& value, TradeEventType& out) {
    if (value == "TRADE_OPENED") { out = TradeEventType::TRADE_OPENED; return true; }
    if (value == "TRADE_CLOSED") { out = TradeEventType::TRADE_CLOSED; return true; }
    return false;
}

} // namespace core
} // namespace signaldesk
