#pragma once

#include "analytics/MarketStructure.h"
#include "common/Types.h"
#include "risk/RiskConfig.h"
#include <optional>

namespace signaldesk {
namespace risk {

// 진입/손절/익절 세트
struct TradeLevels {
    double entry = 0.0;
    EntryType entry_type = EntryType::MARKET;
    double stop_loss = 0.0;
    double take_profit_1 = 0.0;
    std::optional<double> take_profit_2;
    std::optional<double> take_profit_3;
    double rr_ratio = 0.0;
};

// Risk Engine - 상태 없음, 구조 분석 결과로부터 레벨을 계산
class RiskEngine {
public:
    RiskEngine() = default;
    explicit RiskEngine(const RiskConfig& config) : config_(config) {}

    // Throws NoValidSetupError:
    //  - direction == NEUTRAL
    //  - 손절 측 기준 레벨 없음 (BUY: 지지선, SELL: 저항선)
    //  - 손절/익절 거리 퇴화 (RR <= 0 또는 비유한)
    // Throws InvalidArgumentError when mode is AUTO (caller resolves it first).
    TradeLevels computeLevels(
        const analytics::StructureSnapshot& structure,
        double current_price,
        Direction direction,
        TradingMode mode
    ) const;

    // 추세 정렬 + RR + 진입 근접도 가중합, [0, 100]
    double calculateConfidence(
        const analytics::StructureSnapshot& structure,
        const TradeLevels& levels,
        Direction direction,
        double current_price
    ) const;

    // >= 80: 'A', >= 65: 'B', 그 외 'C'
    char qualityTier(double confidence) const;

    const RiskConfig& config() const { return config_; }

    // BULLISH -> BUY, BEARISH -> SELL, RANGING 은 DISCOUNT/PREMIUM 일 때만 역방향 진입
    static Direction inferDirection(const analytics::StructureSnapshot& structure);

    // 잔고 x 트레이드당 위험 비율 / 손절 거리. 거리가 0 이면 0
    static double positionSize(
        double balance,
        double risk_per_trade,
        double entry_price,
        double stop_loss
    );

    static double rewardRisk(double entry, double stop_loss, double take_profit);

private:
    // LIMIT 진입 후보 (오더블록 우선, 그 다음 피보나치)
    std::optional<double> findLimitEntry(
        const analytics::StructureSnapshot& structure,
        double current_price,
        Direction direction,
        double anchor
    ) const;

    RiskConfig config_;
};

} // namespace risk
} // namespace signaldesk
