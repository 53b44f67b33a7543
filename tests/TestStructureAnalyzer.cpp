#include "analytics/StructureAnalyzer.h"
#include "common/Errors.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>

using namespace signaldesk;
using namespace signaldesk::analytics;
using test::near;

int main() {
    std::cout << "[TEST] Starting StructureAnalyzer Test..." << std::endl;

    const StructureAnalyzer analyzer;

    // 1. 상승 시나리오: 지지선 100, 현재가 130
    {
        const auto snapshot = analyzer.analyze(test::uptrendScenario());

        assert(snapshot.trend == Trend::BULLISH);
        assert(near(snapshot.current_price, 130.0));
        assert(snapshot.nearest_support.has_value());
        assert(near(*snapshot.nearest_support, 100.0));
        assert(!snapshot.nearest_resistance.has_value());   // 고점 111, 129 모두 돌파됨

        assert(snapshot.swing_points.size() == 3);
        assert(snapshot.swing_points[0].kind == SwingKind::HIGH && snapshot.swing_points[0].index == 2);
        assert(snapshot.swing_points[1].kind == SwingKind::LOW && snapshot.swing_points[1].index == 10);
        assert(near(snapshot.swing_points[1].price, 100.0));
        assert(!snapshot.swing_points[1].broken);
        assert(snapshot.swing_points[2].index == 35 && near(snapshot.swing_points[2].price, 129.0));
        assert(snapshot.swing_points[2].broken);

        // 130 > 범위 고점 129
        assert(snapshot.price_position == PricePosition::PREMIUM);
        assert(near(*snapshot.range_high, 129.0) && near(*snapshot.range_low, 100.0));
        assert(snapshot.fib_levels.size() == 7);

        assert(snapshot.atr > 2.39 && snapshot.atr < 2.41);

        assert(snapshot.last_bos.has_value());
        assert(snapshot.last_bos->direction == StructureDirection::BULLISH);
        assert(near(snapshot.last_bos->level, 129.0));
        assert(snapshot.last_bos->index == 39);

        // 하락 임펄스(bar 3~10) 직전 양봉, 상승 임펄스(bar 11~) 직전 음봉
        assert(snapshot.order_blocks.size() == 2);
        assert(snapshot.order_blocks[0].direction == StructureDirection::BEARISH);
        assert(snapshot.order_blocks[0].origin_index == 2);
        assert(near(snapshot.order_blocks[0].entry_zone, 108.0));
        assert(snapshot.order_blocks[1].direction == StructureDirection::BULLISH);
        assert(snapshot.order_blocks[1].origin_index == 10);
        assert(near(snapshot.order_blocks[1].entry_zone, 101.0));
        assert(snapshot.order_blocks[1].contains(100.5));
    }

    // 2. 하락 시나리오 (대칭)
    {
        const auto snapshot = analyzer.analyze(test::downtrendScenario());
        assert(snapshot.trend == Trend::BEARISH);
        assert(near(snapshot.current_price, 100.0));
        assert(snapshot.nearest_resistance.has_value());
        assert(near(*snapshot.nearest_resistance, 130.0));
        assert(!snapshot.nearest_support.has_value());
        assert(snapshot.price_position == PricePosition::DISCOUNT);
        assert(snapshot.last_bos.has_value());
        assert(snapshot.last_bos->direction == StructureDirection::BEARISH);
    }

    // 3. 캔들 부족
    {
        auto candles = test::uptrendScenario();
        candles.resize(10);
        bool thrown = false;
        try {
            analyzer.analyze(candles);
        } catch (const InsufficientDataError& e) {
            thrown = true;
            assert(e.available() == 10);
            assert(e.required() == 30);
        }
        assert(thrown);
    }

    // 4. 평평한 구간: 스윙 없음, ATR 0, 균형
    {
        const auto snapshot = analyzer.analyze(test::flatSeries(40, 50.0));
        assert(snapshot.swing_points.empty());
        assert(snapshot.atr == 0.0);
        assert(snapshot.trend == Trend::RANGING);
        assert(snapshot.price_position == PricePosition::EQUILIBRIUM);
        assert(snapshot.fib_levels.empty());
        assert(snapshot.order_blocks.empty());
        assert(!snapshot.last_bos.has_value());
    }

    // 5. 잘못된 캔들 / 시간 역행
    {
        auto candles = test::uptrendScenario();
        candles[5].high = candles[5].low - 1.0;
        bool thrown = false;
        try {
            analyzer.analyze(candles);
        } catch (const InvalidCandleError&) {
            thrown = true;
        }
        assert(thrown);

        candles = test::uptrendScenario();
        candles[20].open_time = candles[19].open_time;
        thrown = false;
        try {
            analyzer.analyze(candles);
        } catch (const InvalidCandleError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // 6. 스윙은 인덱스 순, 종류 교대
    {
        const auto swings = StructureAnalyzer::detectSwings(test::uptrendScenario(), 2);
        for (size_t i = 1; i < swings.size(); ++i) {
            assert(swings[i].index > swings[i - 1].index);
            assert(swings[i].kind != swings[i - 1].kind);
        }
    }

    // 7. 추세 판정 규칙
    {
        auto swing = [](size_t index, double price, SwingKind kind) {
            SwingPoint p;
            p.index = index;
            p.price = price;
            p.kind = kind;
            return p;
        };

        // 종류별 하나씩이면 RANGING
        assert(StructureAnalyzer::classifyTrend({swing(1, 10, SwingKind::LOW), swing(3, 20, SwingKind::HIGH)}) ==
               Trend::RANGING);
        // 고점/저점 모두 하락
        assert(StructureAnalyzer::classifyTrend({
                   swing(1, 30, SwingKind::HIGH), swing(3, 20, SwingKind::LOW),
                   swing(5, 25, SwingKind::HIGH), swing(7, 15, SwingKind::LOW)}) == Trend::BEARISH);
        // 고점 상승, 저점 하락 -> 확장형은 RANGING
        assert(StructureAnalyzer::classifyTrend({
                   swing(1, 30, SwingKind::HIGH), swing(3, 20, SwingKind::LOW),
                   swing(5, 35, SwingKind::HIGH), swing(7, 15, SwingKind::LOW)}) == Trend::RANGING);
    }

    // 8. 가격 위치 경계
    {
        assert(StructureAnalyzer::classifyPricePosition(103.0, 100.0, 110.0, 0.382, 0.618) ==
               PricePosition::DISCOUNT);
        assert(StructureAnalyzer::classifyPricePosition(105.0, 100.0, 110.0, 0.382, 0.618) ==
               PricePosition::EQUILIBRIUM);
        assert(StructureAnalyzer::classifyPricePosition(107.0, 100.0, 110.0, 0.382, 0.618) ==
               PricePosition::PREMIUM);
        assert(StructureAnalyzer::classifyPricePosition(100.0, 100.0, 100.0, 0.382, 0.618) ==
               PricePosition::EQUILIBRIUM);
    }

    std::cout << "[TEST] StructureAnalyzer Test PASSED!" << std::endl;
    return 0;
}
