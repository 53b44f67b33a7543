#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace signaldesk {
namespace analytics {

std::vector<double> TechnicalIndicators::calculateTrueRanges(const std::vector<Candle>& candles) {
    std::vector<double> tr_values;
    tr_values.reserve(candles.size());

    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& current = candles[i];
        double tr = current.high - current.low;
        if (i > 0) {
            const double prev_close = candles[i - 1].close;
            tr = std::max({tr, std::abs(current.high - prev_close), std::abs(current.low - prev_close)});
        }
        tr_values.push_back(tr);
    }

    return tr_values;
}

// ATR 계산 (Average True Range)
double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (candles.size() < 2 || period <= 0) {
        return 0.0;
    }

    // 첫 TR 은 0번째와 1번째 사이에서 발생
    std::vector<double> tr_values = calculateTrueRanges(candles);
    tr_values.erase(tr_values.begin());

    if (tr_values.size() < static_cast<size_t>(period)) {
        return std::accumulate(tr_values.begin(), tr_values.end(), 0.0) / tr_values.size();
    }

    // 초기 ATR (첫 period 개의 평균)
    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    // Wilder's Smoothing으로 끝까지 갱신
    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return atr; // 가장 최신 ATR
}

// Fibonacci Retracement Levels
std::vector<double> TechnicalIndicators::calculateFibonacciLevels(double high, double low) {
    std::vector<double> levels;

    double diff = high - low;

    levels.push_back(low);                        // 0%
    levels.push_back(low + diff * 0.236);         // 23.6%
    levels.push_back(low + diff * 0.382);         // 38.2%
    levels.push_back(low + diff * 0.5);           // 50%
    levels.push_back(low + diff * 0.618);         // 61.8%
    levels.push_back(low + diff * 0.786);         // 78.6%
    levels.push_back(high);                       // 100%

    return levels;
}

bool TechnicalIndicators::isLocalMaximum(
    const std::vector<Candle>& candles,
    size_t index,
    int window
) {
    if (window <= 0 || index < static_cast<size_t>(window) || index + window >= candles.size()) {
        return false;
    }

    double value = candles[index].high;

    for (int i = 1; i <= window; ++i) {
        // 같은 고점이 이어지면 첫 봉만 스윙으로 인정
        if (candles[index - i].high >= value) return false;
        if (candles[index + i].high > value) return false;
    }

    return true;
}

bool TechnicalIndicators::isLocalMinimum(
    const std::vector<Candle>& candles,
    size_t index,
    int window
) {
    if (window <= 0 || index < static_cast<size_t>(window) || index + window >= candles.size()) {
        return false;
    }

    double value = candles[index].low;

    for (int i = 1; i <= window; ++i) {
        if (candles[index - i].low <= value) return false;
        if (candles[index + i].low < value) return false;
    }

    return true;
}

// JSON → Candle 변환
std::vector<Candle> TechnicalIndicators::jsonToCandles(const nlohmann::json& json_candles) {
    std::vector<Candle> candles;
    if (!json_candles.is_array()) return candles;

    auto getDouble = [](const nlohmann::json& row, const char* key, const char* alt) -> double {
        const nlohmann::json* val = nullptr;
        if (row.contains(key)) {
            val = &row[key];
        } else if (alt != nullptr && row.contains(alt)) {
            val = &row[alt];
        }
        if (val == nullptr) return 0.0;
        if (val->is_number()) return val->get<double>();
        if (val->is_string()) {
            try {
                return std::stod(val->get<std::string>());
            } catch (const std::exception&) {
                LOG_WARN("Unparseable candle field {}: {}", key, val->get<std::string>());
            }
        }
        return 0.0;
    };

    for (const auto& jc : json_candles) {
        if (!jc.is_object()) continue;
        Candle c;
        c.open = getDouble(jc, "open", "o");
        c.high = getDouble(jc, "high", "h");
        c.low = getDouble(jc, "low", "l");
        c.close = getDouble(jc, "close", "c");
        c.volume = getDouble(jc, "volume", "v");
        if (jc.contains("open_time") && jc["open_time"].is_number()) {
            c.open_time = jc["open_time"].get<long long>();
        } else if (jc.contains("time") && jc["time"].is_number()) {
            c.open_time = jc["time"].get<long long>();
        }

        candles.push_back(c);
    }

    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) {
                         return a.open_time < b.open_time;
                     });

    return candles;
}

} // namespace analytics
} // namespace signaldesk
