#pragma once

#include "analytics/MarketStructure.h"
#include "common/Types.h"
#include <vector>

namespace signaldesk {
namespace analytics {

struct StructureConfig {
    int swing_window = 2;           // 스윙 판정 좌우 봉 수 (k)
    int atr_period = 14;
    size_t min_bars = 30;
    int impulse_bars = 3;           // 오더블록 임펄스 최소 연속 봉 수
    double discount_threshold = 0.382;
    double premium_threshold = 0.618;
};

// Market structure reader. 내부 상태 없음 - 같은 입력이면 같은 결과
class StructureAnalyzer {
public:
    StructureAnalyzer() = default;
    explicit StructureAnalyzer(const StructureConfig& config) : config_(config) {}

    // Throws InsufficientDataError (< min_bars) or InvalidCandleError.
    StructureSnapshot analyze(const CandleSeries& candles) const;

    const StructureConfig& config() const { return config_; }

    // ===== 단계별 헬퍼 (각각 순수 함수) =====

    // 지역 극값 검출 후 같은 종류가 연속되면 가장 극단적인 것만 남긴다
    static std::vector<SwingPoint> detectSwings(const CandleSeries& candles, int window);

    // 최근 두 스윙 고점/저점 비교
    static Trend classifyTrend(const std::vector<SwingPoint>& swings);

    // 가격 위치 (최근 스윙 저점~고점 범위 기준)
    static PricePosition classifyPricePosition(double price, double range_low, double range_high,
                                               double discount_threshold, double premium_threshold);

    static std::vector<OrderBlock> findOrderBlocks(const CandleSeries& candles, int impulse_bars);

    static std::optional<BOSEvent> findLastBos(const CandleSeries& candles,
                                               const std::vector<SwingPoint>& swings,
                                               Trend trend);

    // 이후 종가가 레벨을 넘어선 적이 없으면 true
    static bool isUnbroken(const CandleSeries& candles, const SwingPoint& swing);

private:
    StructureConfig config_;
};

} // namespace analytics
} // namespace signaldesk
