#pragma once

#include "analytics/StructureAnalyzer.h"
#include "risk/RiskEngine.h"
#include "strategy/Signal.h"
#include <string>

namespace signaldesk {
namespace strategy {

struct SignalRequest {
    std::string symbol;
    std::string timeframe;
    std::string market_type;                // 비어 있으면 심볼로 분류 추정
    TradingMode mode = TradingMode::AUTO;
    std::string strategy = "SMC";
    // NEUTRAL 이면 구조에서 방향을 추론
    Direction direction = Direction::NEUTRAL;
};

// Structure analysis + risk levels -> immutable Signal. 부수효과 없음
class SignalFactory {
public:
    SignalFactory(const analytics::StructureConfig& structure_config,
                  const risk::RiskConfig& risk_config);

    // Throws InsufficientDataError, InvalidCandleError, NoValidSetupError,
    // InvalidArgumentError (unknown market type).
    Signal create(const SignalRequest& request, const CandleSeries& candles) const;

    // created_at 을 고정해야 하는 경우 (재현 가능한 테스트)
    Signal create(const SignalRequest& request, const CandleSeries& candles, long long now_ms) const;

    const analytics::StructureAnalyzer& analyzer() const { return analyzer_; }
    const risk::RiskEngine& riskEngine() const { return risk_engine_; }

private:
    analytics::StructureAnalyzer analyzer_;
    risk::RiskEngine risk_engine_;
};

} // namespace strategy
} // namespace signaldesk
