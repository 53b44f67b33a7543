#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace signaldesk {

using Price = double;
using Quantity = double;
using Amount = double;

enum class Direction { BUY, SELL, NEUTRAL };
enum class EntryType { MARKET, LIMIT };
enum class TradeStatus { OPEN, CLOSED };
enum class CloseReason { MANUAL, MARKET, STOP_LOSS, TAKE_PROFIT };

// 보유 기간 기준 매매 모드 (AUTO는 타임프레임으로 결정)
enum class TradingMode { SCALPING, INTRADAY, SWING, AUTO };

struct Candle {
    long long open_time;
    double open;
    double high;
    double low;
    double close;
    double volume;

    Candle() : open_time(0), open(0), high(0), low(0), close(0), volume(0) {}

    Candle(long long t, double o, double h, double l, double c, double v = 0.0)
        : open_time(t), open(o), high(h), low(l), close(c), volume(v) {}

    bool isBullish() const { return close > open; }
    bool isBearish() const { return close < open; }
};

using CandleSeries = std::vector<Candle>;

// low <= min(open, close) <= max(open, close) <= high
bool isValidCandle(const Candle& candle);

// Throws InvalidCandleError on a malformed bar or a non-increasing open_time.
void validateSeries(const CandleSeries& candles);

long long currentTimestampMs();

// UUID v4 (8-4-4-4-12 소문자 hex)
std::string generateId();

// +1 for BUY, -1 for SELL, 0 for NEUTRAL
inline double directionSign(Direction direction) {
    switch (direction) {
        case Direction::BUY: return 1.0;
        case Direction::SELL: return -1.0;
        case Direction::NEUTRAL: return 0.0;
    }
    return 0.0;
}

std::string toString(Direction direction);
std::string toString(EntryType type);
std::string toString(TradeStatus status);
std::string toString(CloseReason reason);
std::string toString(TradingMode mode);

// Case-insensitive parsers. Unknown values throw InvalidArgumentError.
Direction parseDirection(const std::string& value);
TradeStatus parseTradeStatus(const std::string& value);
CloseReason parseCloseReason(const std::string& value);
TradingMode parseTradingMode(const std::string& value);

// "5min" -> 5, "1h" -> 60, "4h" -> 240, "1d" -> 1440
int timeframeMinutes(const std::string& timeframe);

// AUTO resolves from the timeframe: <= 5m scalping, <= 1h intraday, else swing
TradingMode resolveTradingMode(TradingMode mode, const std::string& timeframe);

} // namespace signaldesk
