#pragma once

#include <vector>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace signaldesk {
namespace analytics {

// Technical Indicators - 구조 분석에 필요한 지표만 유지
class TechnicalIndicators {
public:
    // True Range: max(high-low, |high-prev_close|, |low-prev_close|)
    // 첫 봉은 이전 종가가 없으므로 high-low
    static std::vector<double> calculateTrueRanges(const std::vector<Candle>& candles);

    // ATR (Average True Range) - Wilder's Smoothing
    // 데이터가 period+1 개 미만이면 가용한 TR 의 단순 평균
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // Fibonacci Retracement Levels (0, 23.6, 38.2, 50, 61.8, 78.6, 100 %)
    // levels[0] = low, levels[6] = high
    static std::vector<double> calculateFibonacciLevels(double high, double low);

    // high 가 [index-window, index+window] 최대값이고 왼쪽 봉들보다 엄격히 높은지
    // 창이 시리즈 경계를 벗어나면 false
    static bool isLocalMaximum(const std::vector<Candle>& candles, size_t index, int window);
    static bool isLocalMinimum(const std::vector<Candle>& candles, size_t index, int window);

    // Helper: JSON candles를 Candle 구조체로 변환 (open_time 기준 정렬)
    static std::vector<Candle> jsonToCandles(const nlohmann::json& json_candles);
};

} // namespace analytics
} // namespace signaldesk
