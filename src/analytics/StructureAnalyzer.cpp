#include "analytics/StructureAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace signaldesk {
namespace analytics {

std::string toString(Trend trend) {
    switch (trend) {
        case Trend::BULLISH: return "BULLISH";
        case Trend::BEARISH: return "BEARISH";
        case Trend::RANGING: return "RANGING";
    }
    return "RANGING";
}

std::string toString(PricePosition position) {
    switch (position) {
        case PricePosition::DISCOUNT: return "DISCOUNT";
        case PricePosition::EQUILIBRIUM: return "EQUILIBRIUM";
        case PricePosition::PREMIUM: return "PREMIUM";
    }
    return "EQUILIBRIUM";
}

std::string toString(SwingKind kind) {
    return kind == SwingKind::HIGH ? "HIGH" : "LOW";
}

std::string toString(StructureDirection direction) {
    return direction == StructureDirection::BULLISH ? "BULLISH" : "BEARISH";
}

StructureSnapshot StructureAnalyzer::analyze(const CandleSeries& candles) const {
    if (candles.size() < config_.min_bars) {
        throw InsufficientDataError(candles.size(), config_.min_bars);
    }
    validateSeries(candles);

    StructureSnapshot snapshot;
    snapshot.current_price = candles.back().close;

    // 1. 스윙 포인트
    snapshot.swing_points = detectSwings(candles, config_.swing_window);

    // 2. ATR
    snapshot.atr = TechnicalIndicators::calculateATR(candles, config_.atr_period);

    // 3. 추세
    snapshot.trend = classifyTrend(snapshot.swing_points);

    // 4. 지지/저항 (깨지지 않은 스윙 중 현재가에 가장 가까운 것)
    for (auto& swing : snapshot.swing_points) {
        swing.broken = !isUnbroken(candles, swing);
        if (swing.broken) continue;

        if (swing.kind == SwingKind::LOW && swing.price < snapshot.current_price) {
            if (!snapshot.nearest_support || swing.price > *snapshot.nearest_support) {
                snapshot.nearest_support = swing.price;
            }
        } else if (swing.kind == SwingKind::HIGH && swing.price > snapshot.current_price) {
            if (!snapshot.nearest_resistance || swing.price < *snapshot.nearest_resistance) {
                snapshot.nearest_resistance = swing.price;
            }
        }
    }

    // 5. 가격 위치 (피보나치 범위)
    for (auto it = snapshot.swing_points.rbegin(); it != snapshot.swing_points.rend(); ++it) {
        if (it->kind == SwingKind::HIGH && !snapshot.range_high) snapshot.range_high = it->price;
        if (it->kind == SwingKind::LOW && !snapshot.range_low) snapshot.range_low = it->price;
        if (snapshot.range_high && snapshot.range_low) break;
    }
    if (snapshot.range_high && snapshot.range_low) {
        snapshot.price_position = classifyPricePosition(
            snapshot.current_price, *snapshot.range_low, *snapshot.range_high,
            config_.discount_threshold, config_.premium_threshold);
        if (*snapshot.range_high > *snapshot.range_low) {
            snapshot.fib_levels = TechnicalIndicators::calculateFibonacciLevels(
                *snapshot.range_high, *snapshot.range_low);
        }
    } else {
        snapshot.price_position = PricePosition::EQUILIBRIUM;
    }

    // 6. 오더블록
    snapshot.order_blocks = findOrderBlocks(candles, config_.impulse_bars);

    // 7. BOS
    snapshot.last_bos = findLastBos(candles, snapshot.swing_points, snapshot.trend);

    LOG_DEBUG("Structure: trend={}, position={}, atr={:.6f}, swings={}, order_blocks={}, bos={}",
              toString(snapshot.trend), toString(snapshot.price_position), snapshot.atr,
              snapshot.swing_points.size(), snapshot.order_blocks.size(),
              snapshot.last_bos ? "yes" : "no");

    return snapshot;
}

std::vector<SwingPoint> StructureAnalyzer::detectSwings(const CandleSeries& candles, int window) {
    std::vector<SwingPoint> swings;

    for (size_t i = 0; i < candles.size(); ++i) {
        const bool is_high = TechnicalIndicators::isLocalMaximum(candles, i, window);
        const bool is_low = TechnicalIndicators::isLocalMinimum(candles, i, window);
        if (!is_high && !is_low) continue;

        SwingKind kind = SwingKind::HIGH;
        if (is_high && is_low) {
            // 아웃사이드 바: 직전 스윙과 반대 종류를 택한다
            kind = (!swings.empty() && swings.back().kind == SwingKind::HIGH) ? SwingKind::LOW : SwingKind::HIGH;
        } else if (is_low) {
            kind = SwingKind::LOW;
        }

        SwingPoint point;
        point.index = i;
        point.kind = kind;
        point.price = (kind == SwingKind::HIGH) ? candles[i].high : candles[i].low;

        if (!swings.empty() && swings.back().kind == kind) {
            // 같은 종류 연속 - 더 극단적인 쪽만 유지 (동일하면 먼저 나온 쪽)
            auto& last = swings.back();
            const bool more_extreme = (kind == SwingKind::HIGH) ? point.price > last.price
                                                                : point.price < last.price;
            if (more_extreme) {
                last = point;
            }
            continue;
        }

        swings.push_back(point);
    }

    return swings;
}

Trend StructureAnalyzer::classifyTrend(const std::vector<SwingPoint>& swings) {
    std::vector<double> highs;
    std::vector<double> lows;
    for (const auto& swing : swings) {
        if (swing.kind == SwingKind::HIGH) highs.push_back(swing.price);
        else lows.push_back(swing.price);
    }

    const bool has_highs = highs.size() >= 2;
    const bool has_lows = lows.size() >= 2;
    if (!has_highs && !has_lows) {
        return Trend::RANGING;
    }

    auto rising = [](const std::vector<double>& v) { return v[v.size() - 1] > v[v.size() - 2]; };
    auto falling = [](const std::vector<double>& v) { return v[v.size() - 1] < v[v.size() - 2]; };

    if (has_highs && has_lows) {
        if (rising(highs) && rising(lows)) return Trend::BULLISH;
        if (falling(highs) && falling(lows)) return Trend::BEARISH;
        return Trend::RANGING;
    }

    // 한 종류만 두 개 이상인 경우 그 종류로 판정
    const auto& series = has_highs ? highs : lows;
    if (rising(series)) return Trend::BULLISH;
    if (falling(series)) return Trend::BEARISH;
    return Trend::RANGING;
}

// 위치 구간만 판정. 추세 문맥(상승 중 DISCOUNT 매수, 하락 중 PREMIUM 매도)은
// RiskEngine 의 지정가 진입 판단에서 적용하고, RANGING 의 방향 추론에 그대로 쓰인다.
PricePosition StructureAnalyzer::classifyPricePosition(
    double price,
    double range_low,
    double range_high,
    double discount_threshold,
    double premium_threshold
) {
    const double range = range_high - range_low;
    // 범위가 없으면 (평평한 구간) 균형으로 본다
    if (!(range > 0.0)) {
        return PricePosition::EQUILIBRIUM;
    }

    const double ratio = (price - range_low) / range;
    if (ratio <= discount_threshold) return PricePosition::DISCOUNT;
    if (ratio >= premium_threshold) return PricePosition::PREMIUM;
    return PricePosition::EQUILIBRIUM;
}

std::vector<OrderBlock> StructureAnalyzer::findOrderBlocks(const CandleSeries& candles, int impulse_bars) {
    std::vector<OrderBlock> blocks;
    if (impulse_bars <= 0) return blocks;

    size_t i = 1;
    while (i < candles.size()) {
        const bool bullish = candles[i].isBullish();
        const bool bearish = candles[i].isBearish();
        if (!bullish && !bearish) {
            ++i;
            continue;
        }

        // 같은 색 연속 구간 [start, end)
        const size_t start = i;
        size_t end = i + 1;
        while (end < candles.size() &&
               (bullish ? candles[end].isBullish() : candles[end].isBearish())) {
            ++end;
        }

        const auto& origin = candles[start - 1];
        const bool opposite = bullish ? origin.isBearish() : origin.isBullish();
        if (end - start >= static_cast<size_t>(impulse_bars) && opposite) {
            OrderBlock block;
            block.entry_zone = origin.open;
            block.high = origin.high;
            block.low = origin.low;
            block.direction = bullish ? StructureDirection::BULLISH : StructureDirection::BEARISH;
            block.origin_index = start - 1;
            blocks.push_back(block);
        }

        i = end;
    }

    return blocks;
}

std::optional<BOSEvent> StructureAnalyzer::findLastBos(
    const CandleSeries& candles,
    const std::vector<SwingPoint>& swings,
    Trend trend
) {
    std::optional<BOSEvent> last;
    size_t last_swing_index = 0;

    for (const auto& swing : swings) {
        const bool bullish_break = swing.kind == SwingKind::HIGH && trend != Trend::BEARISH;
        const bool bearish_break = swing.kind == SwingKind::LOW && trend != Trend::BULLISH;
        if (!bullish_break && !bearish_break) continue;

        for (size_t j = swing.index + 1; j < candles.size(); ++j) {
            const double close = candles[j].close;
            const bool broke = bullish_break ? close > swing.price : close < swing.price;
            if (!broke) continue;

            if (!last || j > last->index || (j == last->index && swing.index > last_swing_index)) {
                BOSEvent event;
                event.level = swing.price;
                event.direction = bullish_break ? StructureDirection::BULLISH : StructureDirection::BEARISH;
                event.index = j;
                last = event;
                last_swing_index = swing.index;
            }
            break;
        }
    }

    return last;
}

bool StructureAnalyzer::isUnbroken(const CandleSeries& candles, const SwingPoint& swing) {
    for (size_t j = swing.index + 1; j < candles.size(); ++j) {
        if (swing.kind == SwingKind::LOW && candles[j].close < swing.price) return false;
        if (swing.kind == SwingKind::HIGH && candles[j].close > swing.price) return false;
    }
    return true;
}

} // namespace analytics
} // namespace signaldesk
