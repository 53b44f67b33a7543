#include "strategy/SignalFactory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <cmath>

namespace signaldesk {
namespace strategy {

SignalFactory::SignalFactory(const analytics::StructureConfig& structure_config,
                             const risk::RiskConfig& risk_config)
    : analyzer_(structure_config)
    , risk_engine_(risk_config)
{
}

Signal SignalFactory::create(const SignalRequest& request, const CandleSeries& candles) const {
    return create(request, candles, currentTimestampMs());
}

Signal SignalFactory::create(const SignalRequest& request, const CandleSeries& candles, long long now_ms) const {
    common::InstrumentClass instrument = common::InstrumentClass::CRYPTO;
    if (request.market_type.empty()) {
        instrument = common::inferInstrumentClass(request.symbol);
    } else if (!common::parseInstrumentClass(request.market_type, instrument)) {
        throw InvalidArgumentError("unknown market type: " + request.market_type);
    }

    const TradingMode mode = resolveTradingMode(request.mode, request.timeframe);

    // 1. 구조 분석
    const auto structure = analyzer_.analyze(candles);
    const double current_price = structure.current_price;

    // 2. 방향 (요청이 없으면 구조에서 추론)
    Direction direction = request.direction;
    if (direction == Direction::NEUTRAL) {
        direction = risk::RiskEngine::inferDirection(structure);
    }
    if (direction == Direction::NEUTRAL) {
        throw NoValidSetupError("no directional bias: trend=" + analytics::toString(structure.trend) +
                                ", position=" + analytics::toString(structure.price_position));
    }

    // 3. 레벨
    const auto levels = risk_engine_.computeLevels(structure, current_price, direction, mode);

    Signal signal;
    signal.id = generateId();
    signal.symbol = request.symbol;
    signal.timeframe = request.timeframe;
    signal.mode = mode;
    signal.strategy = request.strategy;
    signal.instrument = instrument;
    signal.direction = direction;
    signal.entry_type = levels.entry_type;
    signal.structure = structure;
    signal.created_at = now_ms;

    // 4. 시장 분류별 정밀도로 반올림
    auto round = [&](double price) { return common::roundPrice(instrument, price, request.symbol); };
    signal.current_price = round(current_price);
    signal.optimal_entry = round(levels.entry);
    signal.stop_loss = round(levels.stop_loss);
    signal.take_profit_1 = round(levels.take_profit_1);
    if (levels.take_profit_2) signal.take_profit_2 = round(*levels.take_profit_2);
    if (levels.take_profit_3) signal.take_profit_3 = round(*levels.take_profit_3);

    // 반올림 후에도 SL < entry < TP1 (SELL 은 반대) 이 유지되어야 한다
    const double sign = directionSign(direction);
    if (!((signal.optimal_entry - signal.stop_loss) * sign > 0.0) ||
        !((signal.take_profit_1 - signal.optimal_entry) * sign > 0.0)) {
        throw NoValidSetupError("levels collapse at instrument precision");
    }
    signal.rr_ratio = risk::RiskEngine::rewardRisk(signal.optimal_entry, signal.stop_loss, signal.take_profit_1);

    // 반올림으로 RR 하한 아래로 밀린 경우 TP1 을 한 틱씩 바깥으로
    const double min_rr = risk_engine_.config().min_reward_risk;
    for (int i = 0; i < 16 && signal.rr_ratio < min_rr; ++i) {
        const int decimals = common::priceDecimals(instrument, signal.take_profit_1, request.symbol);
        signal.take_profit_1 = round(signal.take_profit_1 + sign * std::pow(10.0, -decimals));
        signal.rr_ratio = risk::RiskEngine::rewardRisk(signal.optimal_entry, signal.stop_loss, signal.take_profit_1);
    }

    // 점수는 발행되는 (반올림된) 레벨 기준
    risk::TradeLevels published = levels;
    published.entry = signal.optimal_entry;
    published.stop_loss = signal.stop_loss;
    published.take_profit_1 = signal.take_profit_1;
    published.take_profit_2 = signal.take_profit_2;
    published.take_profit_3 = signal.take_profit_3;
    published.rr_ratio = signal.rr_ratio;
    signal.confidence = risk_engine_.calculateConfidence(structure, published, direction, signal.current_price);
    signal.quality_tier = risk_engine_.qualityTier(signal.confidence);

    LOG_INFO("Signal {} {} {} [{}] {} @ {} (SL {}, TP1 {}, RR {:.2f}, conf {:.1f} {})",
             signal.id, signal.symbol, signal.timeframe, toString(mode), toString(direction),
             common::formatPrice(instrument, signal.optimal_entry, signal.symbol),
             common::formatPrice(instrument, signal.stop_loss, signal.symbol),
             common::formatPrice(instrument, signal.take_profit_1, signal.symbol),
             signal.rr_ratio, signal.confidence, signal.quality_tier);

    return signal;
}

} // namespace strategy
} // namespace signaldesk
