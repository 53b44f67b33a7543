#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace signaldesk {

// config.json -> EngineConfig
//
// {
//   "account":   { "initial_capital", "risk_per_trade", "max_daily_trades" },
//   "bot":       { "enabled", "auto_execute", "auto_execute_min_tier",
//                  "allowed_markets", "strategies" },
//   "market_data": { "candle_count", "price_timeout_ms", "price_freshness_ms" },
//   "desk":      { "rebase_levels_on_confirm", "journal_path", "log_dir", "log_level" },
//   "structure": { ... StructureConfig },
//   "risk":      { ... RiskConfig }
// }
class Config {
public:
    // 파일이 없으면 기본값 (경고 로그). 파싱 실패/잘못된 값은 ConfigError
    static engine::EngineConfig load(const std::string& config_path);

    // 누락된 키는 기본값. Throws ConfigError.
    static engine::EngineConfig fromJson(const nlohmann::json& j);

    static nlohmann::json toJson(const engine::EngineConfig& config);

    // Throws ConfigError with the first violated rule.
    static void validate(const engine::EngineConfig& config);

private:
    Config() = delete;
};

} // namespace signaldesk
