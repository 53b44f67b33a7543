#pragma once

#include "analytics/StructureAnalyzer.h"
#include "risk/RiskConfig.h"
#include <string>
#include <vector>

namespace signaldesk {
namespace engine {

// 엔진 설정 - 불변 값. 변경은 전체 값을 교체하는 방식으로만 (TradingDesk::updateConfig)
struct EngineConfig {
    // 계좌
    double initial_capital;
    double risk_per_trade;              // 트레이드당 위험 비율 (잔고 대비)
    int max_daily_trades;               // UTC 일 기준 신규 진입 수

    // 봇 설정
    bool bot_enabled;
    bool auto_execute;                  // 신호 생성 즉시 진입
    char auto_execute_min_tier;         // 'A' 면 A 등급만, 'B' 면 A/B
    std::vector<std::string> allowed_markets;
    std::vector<std::string> strategies;

    // 시세
    int candle_count;
    int price_timeout_ms;
    int price_freshness_ms;             // 조회 실패 시 마지막 가격 허용 나이

    // 확인 시점 가격으로 SL/TP 거리를 유지하며 이동
    bool rebase_levels_on_confirm;

    // 저장/로그
    std::string journal_path;
    std::string log_dir;
    std::string log_level;

    analytics::StructureConfig structure;
    risk::RiskConfig risk;

    EngineConfig()
        : initial_capital(10000.0)
        , risk_per_trade(0.02)
        , max_daily_trades(10)
        , bot_enabled(false)
        , auto_execute(false)
        , auto_execute_min_tier('A')
        , allowed_markets({"crypto", "forex", "stocks"})
        , strategies({"ICT", "SMC", "WYCKOFF"})
        , candle_count(100)
        , price_timeout_ms(2000)
        , price_freshness_ms(30000)
        , rebase_levels_on_confirm(false)
        , journal_path("state/trades.jsonl")
        , log_dir("logs")
        , log_level("info")
    {}
};

} // namespace engine
} // namespace signaldesk
