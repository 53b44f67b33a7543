#include "analytics/StructureAnalyzer.h"
#include "common/Errors.h"
#include "risk/RiskEngine.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>

using namespace signaldesk;
using namespace signaldesk::analytics;
using risk::RiskEngine;
using risk::TradeLevels;
using test::near;

namespace {

SwingPoint makeSwing(size_t index, double price, SwingKind kind, bool broken = false) {
    SwingPoint p;
    p.index = index;
    p.price = price;
    p.kind = kind;
    p.broken = broken;
    return p;
}

// 지지 95, ATR 2, 위쪽 미돌파 고점 110 / 125
StructureSnapshot bullishSnapshot() {
    StructureSnapshot s;
    s.trend = Trend::BULLISH;
    s.price_position = PricePosition::EQUILIBRIUM;
    s.current_price = 100.0;
    s.nearest_support = 95.0;
    s.atr = 2.0;
    s.swing_points = {
        makeSwing(5, 95.0, SwingKind::LOW),
        makeSwing(10, 110.0, SwingKind::HIGH),
        makeSwing(20, 125.0, SwingKind::HIGH),
        makeSwing(25, 140.0, SwingKind::HIGH, true),   // 돌파된 고점은 목표가 아님
    };
    return s;
}

template <typename Error, typename Fn>
bool throwsAs(Fn fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting RiskEngine Test..." << std::endl;

    const RiskEngine engine;

    // 1. 상승 시나리오 BUY / INTRADAY
    {
        const auto snapshot = StructureAnalyzer().analyze(test::uptrendScenario());
        const auto levels = engine.computeLevels(snapshot, snapshot.current_price, Direction::BUY,
                                                 TradingMode::INTRADAY);

        assert(levels.entry_type == EntryType::MARKET);
        assert(near(levels.entry, 130.0));
        // SL = min(100 - 0.1 x ATR, 130 - ATR)
        assert(near(levels.stop_loss, 100.0 - 0.1 * snapshot.atr));
        assert(levels.stop_loss < 100.0);
        assert(levels.take_profit_1 > 130.0);
        assert(levels.rr_ratio >= 2.0 - 1e-9);
        assert(levels.take_profit_2 && *levels.take_profit_2 > levels.take_profit_1);
        assert(levels.take_profit_3 && *levels.take_profit_3 > *levels.take_profit_2);

        // 추세 정렬 + RR 2 + 시장가 진입 + 정렬된 BOS
        const double confidence = engine.calculateConfidence(snapshot, levels, Direction::BUY,
                                                             snapshot.current_price);
        assert(near(confidence, 82.5, 1e-3));
        assert(engine.qualityTier(confidence) == 'A');
    }

    // 2. 하락 시나리오 SELL (대칭)
    {
        const auto snapshot = StructureAnalyzer().analyze(test::downtrendScenario());
        const auto levels = engine.computeLevels(snapshot, snapshot.current_price, Direction::SELL,
                                                 TradingMode::INTRADAY);
        assert(levels.entry_type == EntryType::MARKET);
        assert(levels.stop_loss > 130.0);
        assert(levels.take_profit_1 < 100.0 && levels.take_profit_1 > 0.0);
        assert(levels.rr_ratio >= 2.0 - 1e-9);
        assert(*levels.take_profit_2 < levels.take_profit_1);
    }

    // 3. 구조 레벨 목표: RR 하한 미달 레벨은 건너뛰고, 이후는 +1R
    {
        const auto snapshot = bullishSnapshot();
        const auto levels = engine.computeLevels(snapshot, 100.0, Direction::BUY, TradingMode::INTRADAY);
        // SL = min(95 - 0.2, 100 - 2) = 94.8, risk 5.2
        assert(near(levels.stop_loss, 94.8));
        // 110 은 RR 1.92 -> 건너뜀, 125 는 RR 4.8
        assert(near(levels.take_profit_1, 125.0));
        // 3R (115.6) 이 TP1 안쪽이므로 TP1 + 1R
        assert(near(*levels.take_profit_2, 130.2));
        assert(near(*levels.take_profit_3, 135.4));
        assert(near(levels.rr_ratio, 25.0 / 5.2));
    }

    // 4. 모드별 손절 배수: 짧은 보유일수록 좁다
    {
        auto snapshot = bullishSnapshot();
        snapshot.nearest_support = 99.5;
        const auto scalp = engine.computeLevels(snapshot, 100.0, Direction::BUY, TradingMode::SCALPING);
        const auto intraday = engine.computeLevels(snapshot, 100.0, Direction::BUY, TradingMode::INTRADAY);
        const auto swing = engine.computeLevels(snapshot, 100.0, Direction::BUY, TradingMode::SWING);
        assert(near(scalp.stop_loss, 99.0));
        assert(near(intraday.stop_loss, 98.0));
        assert(near(swing.stop_loss, 97.0));
    }

    // 5. DISCOUNT 에서 BUY: 가장 가까운 아래쪽 피보나치 레벨로 지정가
    {
        auto snapshot = bullishSnapshot();
        snapshot.price_position = PricePosition::DISCOUNT;
        snapshot.current_price = 97.0;
        snapshot.nearest_support = 92.0;
        snapshot.range_low = 90.0;
        snapshot.range_high = 110.0;
        snapshot.fib_levels = {90.0, 94.72, 97.64, 100.0, 102.36, 105.72, 110.0};

        const auto levels = engine.computeLevels(snapshot, 97.0, Direction::BUY, TradingMode::INTRADAY);
        assert(levels.entry_type == EntryType::LIMIT);
        assert(near(levels.entry, 94.72));
        assert(levels.stop_loss < 92.0);

        // 거리 2.28 / (2 x ATR) -> entry_score 0.43
        const double confidence = engine.calculateConfidence(snapshot, levels, Direction::BUY, 97.0);
        const double expected = 100.0 * (0.4 * 1.0 + 0.35 * std::min(levels.rr_ratio / 4.0, 1.0) + 0.25 * 0.43);
        assert(near(confidence, expected, 1e-6));
    }

    // 6. 같은 방향 오더블록 안의 가격: 블록 시가로 지정가
    {
        auto snapshot = bullishSnapshot();
        OrderBlock block;
        block.direction = StructureDirection::BULLISH;
        block.entry_zone = 97.0;
        block.high = 99.0;
        block.low = 96.0;
        block.origin_index = 15;
        snapshot.order_blocks.push_back(block);
        snapshot.current_price = 98.0;

        const auto levels = engine.computeLevels(snapshot, 98.0, Direction::BUY, TradingMode::INTRADAY);
        assert(levels.entry_type == EntryType::LIMIT);
        assert(near(levels.entry, 97.0));

        // 반대 방향 주문에는 사용하지 않음
        snapshot.nearest_resistance = 112.0;
        const auto sell = engine.computeLevels(snapshot, 98.0, Direction::SELL, TradingMode::INTRADAY);
        assert(sell.entry_type == EntryType::MARKET);
    }

    // 7. 실패 경로
    {
        const auto snapshot = bullishSnapshot();
        assert(throwsAs<NoValidSetupError>([&] {
            engine.computeLevels(snapshot, 100.0, Direction::NEUTRAL, TradingMode::INTRADAY);
        }));
        // SELL 인데 저항선 없음
        assert(throwsAs<NoValidSetupError>([&] {
            engine.computeLevels(snapshot, 100.0, Direction::SELL, TradingMode::INTRADAY);
        }));
        assert(throwsAs<InvalidArgumentError>([&] {
            engine.computeLevels(snapshot, 100.0, Direction::BUY, TradingMode::AUTO);
        }));
        // 지지선 = 현재가, ATR 0 -> 손절 거리 0
        auto flat = snapshot;
        flat.atr = 0.0;
        flat.nearest_support = 100.0;
        assert(throwsAs<NoValidSetupError>([&] {
            engine.computeLevels(flat, 100.0, Direction::BUY, TradingMode::INTRADAY);
        }));
    }

    // 8. 방향 추론
    {
        StructureSnapshot s;
        s.trend = Trend::BULLISH;
        assert(RiskEngine::inferDirection(s) == Direction::BUY);
        s.trend = Trend::BEARISH;
        assert(RiskEngine::inferDirection(s) == Direction::SELL);
        s.trend = Trend::RANGING;
        s.price_position = PricePosition::DISCOUNT;
        assert(RiskEngine::inferDirection(s) == Direction::BUY);
        s.price_position = PricePosition::PREMIUM;
        assert(RiskEngine::inferDirection(s) == Direction::SELL);
        s.price_position = PricePosition::EQUILIBRIUM;
        assert(RiskEngine::inferDirection(s) == Direction::NEUTRAL);
    }

    // 9. 등급 경계, 포지션 크기, RR
    {
        assert(engine.qualityTier(80.0) == 'A');
        assert(engine.qualityTier(79.99) == 'B');
        assert(engine.qualityTier(65.0) == 'B');
        assert(engine.qualityTier(64.99) == 'C');

        assert(near(RiskEngine::positionSize(10000.0, 0.02, 100.0, 95.0), 40.0));
        assert(RiskEngine::positionSize(10000.0, 0.02, 100.0, 100.0) == 0.0);
        assert(RiskEngine::positionSize(0.0, 0.02, 100.0, 95.0) == 0.0);

        assert(near(RiskEngine::rewardRisk(100.0, 95.0, 110.0), 2.0));
        assert(RiskEngine::rewardRisk(100.0, 100.0, 110.0) == 0.0);
    }

    // 10. 반대 추세 신호는 confidence 가 낮다
    {
        auto snapshot = bullishSnapshot();
        snapshot.nearest_resistance = 104.0;
        const auto levels = engine.computeLevels(snapshot, 100.0, Direction::SELL, TradingMode::INTRADAY);
        const double confidence = engine.calculateConfidence(snapshot, levels, Direction::SELL, 100.0);
        assert(confidence < 65.0);
        assert(engine.qualityTier(confidence) == 'C');
    }

    std::cout << "[TEST] RiskEngine Test PASSED!" << std::endl;
    return 0;
}
