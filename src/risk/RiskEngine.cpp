#include "risk/RiskEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace signaldesk {
namespace risk {

using analytics::PricePosition;
using analytics::StructureDirection;
using analytics::StructureSnapshot;
using analytics::SwingKind;
using analytics::Trend;

namespace {

bool isFinitePositive(double v) {
    return std::isfinite(v) && v > 0.0;
}

// entry 기준 유리한 쪽에 있는 가격인지 (BUY: 위, SELL: 아래)
bool isBeyond(double price, double reference, Direction direction) {
    return direction == Direction::BUY ? price > reference : price < reference;
}

} // namespace

TradeLevels RiskEngine::computeLevels(
    const StructureSnapshot& structure,
    double current_price,
    Direction direction,
    TradingMode mode
) const {
    if (mode == TradingMode::AUTO) {
        throw InvalidArgumentError("trading mode must be resolved before computing levels");
    }
    if (direction == Direction::NEUTRAL) {
        throw NoValidSetupError("no directional bias");
    }
    if (!isFinitePositive(current_price)) {
        throw NoValidSetupError("invalid current price");
    }

    const bool is_buy = direction == Direction::BUY;
    const std::optional<double> anchor = is_buy ? structure.nearest_support : structure.nearest_resistance;
    if (!anchor) {
        throw NoValidSetupError(is_buy ? "no support below price for BUY stop"
                                       : "no resistance above price for SELL stop");
    }

    const double atr = std::max(0.0, structure.atr);
    const double sign = directionSign(direction);

    TradeLevels levels;

    // 1) 진입가
    const auto limit_entry = findLimitEntry(structure, current_price, direction, *anchor);
    if (limit_entry) {
        levels.entry = *limit_entry;
        levels.entry_type = EntryType::LIMIT;
    } else {
        levels.entry = current_price;
        levels.entry_type = EntryType::MARKET;
    }

    // 2) 손절: 구조 레벨 바깥 버퍼와 ATR 거리 중 더 먼 쪽
    const double stop_distance = atr * config_.stopMultiplier(mode);
    const double buffer = atr * config_.anchor_buffer_atr;
    if (is_buy) {
        levels.stop_loss = std::min(*anchor - buffer, levels.entry - stop_distance);
    } else {
        levels.stop_loss = std::max(*anchor + buffer, levels.entry + stop_distance);
    }

    const double risk = std::fabs(levels.entry - levels.stop_loss);
    if (!isFinitePositive(risk)) {
        throw NoValidSetupError("degenerate stop distance");
    }

    // 3) 익절 후보: 진입가 너머의 깨지지 않은 구조 레벨 (가까운 순)
    std::vector<double> candidates;
    const SwingKind target_kind = is_buy ? SwingKind::HIGH : SwingKind::LOW;
    for (const auto& swing : structure.swing_points) {
        if (swing.kind != target_kind || swing.broken) continue;
        if (isBeyond(swing.price, levels.entry, direction)) {
            candidates.push_back(swing.price);
        }
    }
    std::sort(candidates.begin(), candidates.end(), [is_buy](double a, double b) {
        return is_buy ? a < b : a > b;
    });
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    auto scaled = [&](double multiple) { return levels.entry + sign * risk * multiple; };

    // TP1: RR 하한을 만족하는 첫 구조 레벨, 없으면 하한 배수로 확장
    size_t next = 0;
    std::optional<double> tp1;
    for (; next < candidates.size(); ++next) {
        if (rewardRisk(levels.entry, levels.stop_loss, candidates[next]) >= config_.min_reward_risk) {
            tp1 = candidates[next++];
            break;
        }
    }
    levels.take_profit_1 = tp1 ? *tp1 : scaled(config_.min_reward_risk);

    if (!isFinitePositive(levels.take_profit_1)) {
        throw NoValidSetupError("degenerate take profit");
    }

    // TP2/TP3: 다음 구조 레벨, 없으면 배수. 항상 직전 목표보다 멀리
    auto nextTarget = [&](double previous, double multiple) -> std::optional<double> {
        while (next < candidates.size()) {
            const double level = candidates[next++];
            if (isBeyond(level, previous, direction)) {
                return level;
            }
        }
        double target = scaled(multiple);
        if (!isBeyond(target, previous, direction)) {
            target = previous + sign * risk;
        }
        if (!isFinitePositive(target)) {
            return std::nullopt;
        }
        return target;
    };

    levels.take_profit_2 = nextTarget(levels.take_profit_1, config_.tp2_multiple);
    if (levels.take_profit_2) {
        levels.take_profit_3 = nextTarget(*levels.take_profit_2, config_.tp3_multiple);
    }

    levels.rr_ratio = rewardRisk(levels.entry, levels.stop_loss, levels.take_profit_1);
    if (!isFinitePositive(levels.rr_ratio)) {
        throw NoValidSetupError("degenerate reward/risk");
    }

    LOG_DEBUG("Levels: {} {} entry={:.6f} sl={:.6f} tp1={:.6f} rr={:.2f}",
              toString(direction), toString(levels.entry_type),
              levels.entry, levels.stop_loss, levels.take_profit_1, levels.rr_ratio);

    return levels;
}

std::optional<double> RiskEngine::findLimitEntry(
    const StructureSnapshot& structure,
    double current_price,
    Direction direction,
    double anchor
) const {
    const bool is_buy = direction == Direction::BUY;

    auto usable = [&](double price) {
        if (!isFinitePositive(price)) return false;
        // 현재가보다 유리한 쪽, 그리고 손절 기준 레벨 안쪽
        return is_buy ? (price < current_price && price > anchor)
                      : (price > current_price && price < anchor);
    };

    // 1) 가격이 같은 방향 오더블록 안에 있으면 블록 시가 (최근 블록 우선)
    const StructureDirection wanted = is_buy ? StructureDirection::BULLISH : StructureDirection::BEARISH;
    for (auto it = structure.order_blocks.rbegin(); it != structure.order_blocks.rend(); ++it) {
        if (it->direction != wanted || !it->contains(current_price)) continue;
        if (usable(it->entry_zone)) {
            return it->entry_zone;
        }
    }

    // 2) DISCOUNT(BUY) / PREMIUM(SELL): 현재가 너머 가장 가까운 피보나치 레벨
    const PricePosition favourable = is_buy ? PricePosition::DISCOUNT : PricePosition::PREMIUM;
    if (structure.price_position == favourable) {
        std::optional<double> best;
        for (double level : structure.fib_levels) {
            if (!usable(level)) continue;
            if (!best || (is_buy ? level > *best : level < *best)) {
                best = level;
            }
        }
        if (best) {
            return best;
        }
    }

    return std::nullopt;
}

double RiskEngine::calculateConfidence(
    const StructureSnapshot& structure,
    const TradeLevels& levels,
    Direction direction,
    double current_price
) const {
    // 추세 정렬
    double trend_score = 0.5;
    if (structure.trend == Trend::BULLISH) {
        trend_score = direction == Direction::BUY ? 1.0 : 0.0;
    } else if (structure.trend == Trend::BEARISH) {
        trend_score = direction == Direction::SELL ? 1.0 : 0.0;
    }

    // RR
    double rr_score = 0.0;
    if (config_.rr_score_cap > 0.0) {
        rr_score = std::min(std::max(levels.rr_ratio, 0.0) / config_.rr_score_cap, 1.0);
    }

    // 진입 근접도 (지정가가 멀수록 체결 가능성 낮음)
    double entry_score = 1.0;
    if (levels.entry_type == EntryType::LIMIT) {
        const double reach = structure.atr * 2.0;
        const double distance = std::fabs(current_price - levels.entry);
        entry_score = reach > 0.0 ? 1.0 - std::min(distance / reach, 1.0) : 0.0;
    }
    if (structure.last_bos) {
        const bool aligned =
            (direction == Direction::BUY && structure.last_bos->direction == StructureDirection::BULLISH) ||
            (direction == Direction::SELL && structure.last_bos->direction == StructureDirection::BEARISH);
        if (aligned) {
            entry_score = std::min(entry_score + config_.bos_bonus, 1.0);
        }
    }

    const double raw = 100.0 * (config_.trend_weight * trend_score +
                                config_.rr_weight * rr_score +
                                config_.entry_weight * entry_score);
    return std::clamp(raw, 0.0, 100.0);
}

char RiskEngine::qualityTier(double confidence) const {
    if (confidence >= config_.tier_a_threshold) return 'A';
    if (confidence >= config_.tier_b_threshold) return 'B';
    return 'C';
}

Direction RiskEngine::inferDirection(const StructureSnapshot& structure) {
    switch (structure.trend) {
        case Trend::BULLISH: return Direction::BUY;
        case Trend::BEARISH: return Direction::SELL;
        case Trend::RANGING:
            if (structure.price_position == PricePosition::DISCOUNT) return Direction::BUY;
            if (structure.price_position == PricePosition::PREMIUM) return Direction::SELL;
            return Direction::NEUTRAL;
    }
    return Direction::NEUTRAL;
}

double RiskEngine::positionSize(
    double balance,
    double risk_per_trade,
    double entry_price,
    double stop_loss
) {
    const double distance = std::fabs(entry_price - stop_loss);
    if (!isFinitePositive(distance) || balance <= 0.0 || risk_per_trade <= 0.0) {
        return 0.0;
    }
    return balance * risk_per_trade / distance;
}

double RiskEngine::rewardRisk(double entry, double stop_loss, double take_profit) {
    const double risk = std::fabs(entry - stop_loss);
    if (!(risk > 0.0)) {
        return 0.0;
    }
    return std::fabs(take_profit - entry) / risk;
}

} // namespace risk
} // namespace signaldesk
