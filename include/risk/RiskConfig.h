#pragma once

#include "common/Types.h"

namespace signaldesk {
namespace risk {

struct RiskConfig {
    // 손절 거리 = ATR x 배수 (보유 기간이 길수록 넓게)
    double scalping_stop_multiplier = 0.5;
    double intraday_stop_multiplier = 1.0;
    double swing_stop_multiplier = 1.5;

    // 지지/저항 바깥 버퍼 (ATR 배수)
    double anchor_buffer_atr = 0.1;

    // Reward/Risk
    double min_reward_risk = 2.0;   // TP1 최소 RR
    double tp2_multiple = 3.0;
    double tp3_multiple = 4.0;

    // Confidence 가중치 (합 1.0)
    double trend_weight = 0.40;
    double rr_weight = 0.35;
    double entry_weight = 0.25;
    double rr_score_cap = 4.0;      // 이 RR 이상이면 rr_score = 1
    double bos_bonus = 0.10;

    // 품질 등급 경계
    double tier_a_threshold = 80.0;
    double tier_b_threshold = 65.0;

    double stopMultiplier(TradingMode mode) const {
        switch (mode) {
            case TradingMode::SCALPING: return scalping_stop_multiplier;
            case TradingMode::SWING: return swing_stop_multiplier;
            case TradingMode::INTRADAY:
            case TradingMode::AUTO:
                return intraday_stop_multiplier;
        }
        return intraday_stop_multiplier;
    }
};

} // namespace risk
} // namespace signaldesk
