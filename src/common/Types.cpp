#include "common/Types.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>

namespace signaldesk {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

bool isValidCandle(const Candle& candle) {
    const double body_low = std::min(candle.open, candle.close);
    const double body_high = std::max(candle.open, candle.close);
    return candle.low <= body_low && body_high <= candle.high;
}

void validateSeries(const CandleSeries& candles) {
    for (std::size_t i = 0; i < candles.size(); ++i) {
        if (!isValidCandle(candles[i])) {
            throw InvalidCandleError("malformed candle at index " + std::to_string(i));
        }
        if (i > 0 && candles[i].open_time <= candles[i - 1].open_time) {
            throw InvalidCandleError("open_time not strictly increasing at index " + std::to_string(i));
        }
    }
}

long long currentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string generateId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<unsigned long long> dist;

    // version 4, variant 10xx
    const unsigned long long hi = (dist(rng) & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    const unsigned long long lo = (dist(rng) & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  (hi >> 32) & 0xFFFFFFFFULL,
                  (hi >> 16) & 0xFFFFULL,
                  hi & 0xFFFFULL,
                  (lo >> 48) & 0xFFFFULL,
                  lo & 0xFFFFFFFFFFFFULL);
    return std::string(buf);
}

std::string toString(Direction direction) {
    switch (direction) {
        case Direction::BUY: return "BUY";
        case Direction::SELL: return "SELL";
        case Direction::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::string toString(EntryType type) {
    return type == EntryType::LIMIT ? "LIMIT" : "MARKET";
}

std::string toString(TradeStatus status) {
    return status == TradeStatus::OPEN ? "OPEN" : "CLOSED";
}

std::string toString(CloseReason reason) {
    switch (reason) {
        case CloseReason::MANUAL: return "MANUAL";
        case CloseReason::MARKET: return "MARKET";
        case CloseReason::STOP_LOSS: return "STOP_LOSS";
        case CloseReason::TAKE_PROFIT: return "TAKE_PROFIT";
    }
    return "MANUAL";
}

std::string toString(TradingMode mode) {
    switch (mode) {
        case TradingMode::SCALPING: return "scalping";
        case TradingMode::INTRADAY: return "intraday";
        case TradingMode::SWING: return "swing";
        case TradingMode::AUTO: return "auto";
    }
    return "auto";
}

Direction parseDirection(const std::string& value) {
    const std::string v = toUpperCopy(value);
    if (v == "BUY" || v == "LONG") return Direction::BUY;
    if (v == "SELL" || v == "SHORT") return Direction::SELL;
    if (v == "NEUTRAL") return Direction::NEUTRAL;
    throw InvalidArgumentError("unknown direction: " + value);
}

TradeStatus parseTradeStatus(const std::string& value) {
    const std::string v = toUpperCopy(value);
    if (v == "OPEN") return TradeStatus::OPEN;
    if (v == "CLOSED") return TradeStatus::CLOSED;
    throw InvalidArgumentError("unknown trade status: " + value);
}

CloseReason parseCloseReason(const std::string& value) {
    const std::string v = toUpperCopy(value);
    if (v == "MANUAL") return CloseReason::MANUAL;
    if (v == "MARKET") return CloseReason::MARKET;
    if (v == "STOP_LOSS" || v == "SL") return CloseReason::STOP_LOSS;
    if (v == "TAKE_PROFIT" || v == "TP") return CloseReason::TAKE_PROFIT;
    throw InvalidArgumentError("unknown close reason: " + value);
}

TradingMode parseTradingMode(const std::string& value) {
    const std::string v = toUpperCopy(value);
    if (v == "SCALPING") return TradingMode::SCALPING;
    if (v == "INTRADAY") return TradingMode::INTRADAY;
    if (v == "SWING") return TradingMode::SWING;
    if (v == "AUTO") return TradingMode::AUTO;
    throw InvalidArgumentError("unknown trading mode: " + value);
}

int timeframeMinutes(const std::string& timeframe) {
    std::string tf;
    for (char c : timeframe) {
        tf.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    std::size_t pos = 0;
    while (pos < tf.size() && std::isdigit(static_cast<unsigned char>(tf[pos]))) {
        ++pos;
    }
    if (pos == 0) {
        throw InvalidArgumentError("invalid timeframe: " + timeframe);
    }

    const int amount = std::stoi(tf.substr(0, pos));
    const std::string unit = tf.substr(pos);
    if (unit == "m" || unit == "min") return amount;
    if (unit == "h") return amount * 60;
    if (unit == "d") return amount * 1440;
    if (unit == "w") return amount * 10080;
    throw InvalidArgumentError("invalid timeframe: " + timeframe);
}

TradingMode resolveTradingMode(TradingMode mode, const std::string& timeframe) {
    if (mode != TradingMode::AUTO) {
        return mode;
    }
    const int minutes = timeframeMinutes(timeframe);
    if (minutes <= 5) return TradingMode::SCALPING;
    if (minutes <= 60) return TradingMode::INTRADAY;
    return TradingMode::SWING;
}

} // namespace signaldesk
