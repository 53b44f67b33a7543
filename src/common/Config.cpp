#include "common/Config.h"
#include "common/Errors.h"
#include "common/InstrumentClass.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace signaldesk {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeMarketName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimCopy(name);
}

// 전략 태그는 대문자로 통일 ("smc" -> "SMC")
std::string normalizeStrategyName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(name);
}

void require(bool ok, const std::string& message) {
    if (!ok) {
        throw ConfigError(message);
    }
}
}

engine::EngineConfig Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} - using defaults", config_path.string());
        return engine::EngineConfig();
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("malformed config json: ") + e.what());
    }

    auto config = fromJson(j);
    LOG_INFO("Config loaded: capital={:.2f}, risk/trade={:.4f}, max_daily_trades={}, auto_execute={}",
             config.initial_capital, config.risk_per_trade, config.max_daily_trades, config.auto_execute);
    return config;
}

engine::EngineConfig Config::fromJson(const nlohmann::json& j) {
    engine::EngineConfig config;

    try {
        if (j.contains("account")) {
            auto& a = j["account"];
            config.initial_capital = a.value("initial_capital", config.initial_capital);
            config.risk_per_trade = a.value("risk_per_trade", config.risk_per_trade);
            config.max_daily_trades = a.value("max_daily_trades", config.max_daily_trades);
        }

        if (j.contains("bot")) {
            auto& b = j["bot"];
            config.bot_enabled = b.value("enabled", config.bot_enabled);
            config.auto_execute = b.value("auto_execute", config.auto_execute);

            const std::string tier = trimCopy(b.value("auto_execute_min_tier", std::string(1, config.auto_execute_min_tier)));
            require(tier.size() == 1, "bot.auto_execute_min_tier must be one of A, B, C");
            config.auto_execute_min_tier = static_cast<char>(std::toupper(static_cast<unsigned char>(tier[0])));

            if (b.contains("allowed_markets")) {
                config.allowed_markets = b["allowed_markets"].get<std::vector<std::string>>();
                for (auto& market : config.allowed_markets) {
                    market = normalizeMarketName(market);
                }
            }
            if (b.contains("strategies")) {
                config.strategies = b["strategies"].get<std::vector<std::string>>();
                for (auto& strategy_name : config.strategies) {
                    strategy_name = normalizeStrategyName(strategy_name);
                }
            }
        }

        if (j.contains("market_data")) {
            auto& m = j["market_data"];
            config.candle_count = m.value("candle_count", config.candle_count);
            config.price_timeout_ms = m.value("price_timeout_ms", config.price_timeout_ms);
            config.price_freshness_ms = m.value("price_freshness_ms", config.price_freshness_ms);
        }

        if (j.contains("desk")) {
            auto& d = j["desk"];
            config.rebase_levels_on_confirm = d.value("rebase_levels_on_confirm", config.rebase_levels_on_confirm);
            config.journal_path = d.value("journal_path", config.journal_path);
            config.log_dir = d.value("log_dir", config.log_dir);
            config.log_level = d.value("log_level", config.log_level);
        }

        if (j.contains("structure")) {
            auto& s = j["structure"];
            auto& sc = config.structure;
            sc.swing_window = s.value("swing_window", sc.swing_window);
            sc.atr_period = s.value("atr_period", sc.atr_period);
            sc.min_bars = s.value("min_bars", sc.min_bars);
            sc.impulse_bars = s.value("impulse_bars", sc.impulse_bars);
            sc.discount_threshold = s.value("discount_threshold", sc.discount_threshold);
            sc.premium_threshold = s.value("premium_threshold", sc.premium_threshold);
        }

        if (j.contains("risk")) {
            auto& r = j["risk"];
            auto& rc = config.risk;
            rc.scalping_stop_multiplier = r.value("scalping_stop_multiplier", rc.scalping_stop_multiplier);
            rc.intraday_stop_multiplier = r.value("intraday_stop_multiplier", rc.intraday_stop_multiplier);
            rc.swing_stop_multiplier = r.value("swing_stop_multiplier", rc.swing_stop_multiplier);
            rc.anchor_buffer_atr = r.value("anchor_buffer_atr", rc.anchor_buffer_atr);
            rc.min_reward_risk = r.value("min_reward_risk", rc.min_reward_risk);
            rc.tp2_multiple = r.value("tp2_multiple", rc.tp2_multiple);
            rc.tp3_multiple = r.value("tp3_multiple", rc.tp3_multiple);
            rc.trend_weight = r.value("trend_weight", rc.trend_weight);
            rc.rr_weight = r.value("rr_weight", rc.rr_weight);
            rc.entry_weight = r.value("entry_weight", rc.entry_weight);
            rc.rr_score_cap = r.value("rr_score_cap", rc.rr_score_cap);
            rc.bos_bonus = r.value("bos_bonus", rc.bos_bonus);
            rc.tier_a_threshold = r.value("tier_a_threshold", rc.tier_a_threshold);
            rc.tier_b_threshold = r.value("tier_b_threshold", rc.tier_b_threshold);
        }
    } catch (const nlohmann::json::exception& e) {
        // 타입 불일치 (예: 숫자 자리에 문자열)
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    validate(config);
    return config;
}

nlohmann::json Config::toJson(const engine::EngineConfig& config) {
    nlohmann::json j;
    j["account"] = {
        {"initial_capital", config.initial_capital},
        {"risk_per_trade", config.risk_per_trade},
        {"max_daily_trades", config.max_daily_trades}
    };
    j["bot"] = {
        {"enabled", config.bot_enabled},
        {"auto_execute", config.auto_execute},
        {"auto_execute_min_tier", std::string(1, config.auto_execute_min_tier)},
        {"allowed_markets", config.allowed_markets},
        {"strategies", config.strategies}
    };
    j["market_data"] = {
        {"candle_count", config.candle_count},
        {"price_timeout_ms", config.price_timeout_ms},
        {"price_freshness_ms", config.price_freshness_ms}
    };
    j["desk"] = {
        {"rebase_levels_on_confirm", config.rebase_levels_on_confirm},
        {"journal_path", config.journal_path},
        {"log_dir", config.log_dir},
        {"log_level", config.log_level}
    };

    const auto& sc = config.structure;
    j["structure"] = {
        {"swing_window", sc.swing_window},
        {"atr_period", sc.atr_period},
        {"min_bars", sc.min_bars},
        {"impulse_bars", sc.impulse_bars},
        {"discount_threshold", sc.discount_threshold},
        {"premium_threshold", sc.premium_threshold}
    };

    const auto& rc = config.risk;
    j["risk"] = {
        {"scalping_stop_multiplier", rc.scalping_stop_multiplier},
        {"intraday_stop_multiplier", rc.intraday_stop_multiplier},
        {"swing_stop_multiplier", rc.swing_stop_multiplier},
        {"anchor_buffer_atr", rc.anchor_buffer_atr},
        {"min_reward_risk", rc.min_reward_risk},
        {"tp2_multiple", rc.tp2_multiple},
        {"tp3_multiple", rc.tp3_multiple},
        {"trend_weight", rc.trend_weight},
        {"rr_weight", rc.rr_weight},
        {"entry_weight", rc.entry_weight},
        {"rr_score_cap", rc.rr_score_cap},
        {"bos_bonus", rc.bos_bonus},
        {"tier_a_threshold", rc.tier_a_threshold},
        {"tier_b_threshold", rc.tier_b_threshold}
    };
    return j;
}

void Config::validate(const engine::EngineConfig& config) {
    require(config.initial_capital > 0.0, "account.initial_capital must be > 0");
    require(config.risk_per_trade > 0.0 && config.risk_per_trade <= 1.0,
            "account.risk_per_trade must be in (0, 1]");
    require(config.max_daily_trades >= 1, "account.max_daily_trades must be >= 1");

    const char tier = config.auto_execute_min_tier;
    require(tier == 'A' || tier == 'B' || tier == 'C', "bot.auto_execute_min_tier must be one of A, B, C");

    for (const auto& market : config.allowed_markets) {
        common::InstrumentClass parsed;
        require(common::parseInstrumentClass(market, parsed), "bot.allowed_markets: unknown market class '" + market + "'");
    }

    require(config.candle_count > 0, "market_data.candle_count must be > 0");
    require(config.price_timeout_ms > 0, "market_data.price_timeout_ms must be > 0");
    require(config.price_freshness_ms >= 0, "market_data.price_freshness_ms must be >= 0");

    const auto& sc = config.structure;
    require(sc.swing_window >= 1, "structure.swing_window must be >= 1");
    require(sc.atr_period >= 1, "structure.atr_period must be >= 1");
    require(sc.impulse_bars >= 1, "structure.impulse_bars must be >= 1");
    require(sc.min_bars >= static_cast<size_t>(2 * sc.swing_window + 1),
            "structure.min_bars must cover at least one swing window");
    require(sc.discount_threshold > 0.0 && sc.discount_threshold < sc.premium_threshold && sc.premium_threshold < 1.0,
            "structure thresholds must satisfy 0 < discount < premium < 1");
    require(static_cast<size_t>(config.candle_count) >= sc.min_bars,
            "market_data.candle_count must be >= structure.min_bars");

    const auto& rc = config.risk;
    require(rc.scalping_stop_multiplier > 0.0 &&
            rc.scalping_stop_multiplier < rc.intraday_stop_multiplier &&
            rc.intraday_stop_multiplier < rc.swing_stop_multiplier,
            "risk stop multipliers must be strictly increasing: scalping < intraday < swing");
    require(rc.anchor_buffer_atr >= 0.0, "risk.anchor_buffer_atr must be >= 0");
    require(rc.min_reward_risk > 0.0, "risk.min_reward_risk must be > 0");
    require(rc.tp2_multiple > rc.min_reward_risk && rc.tp3_multiple > rc.tp2_multiple,
            "risk target multiples must satisfy min_reward_risk < tp2_multiple < tp3_multiple");
    require(rc.trend_weight >= 0.0 && rc.rr_weight >= 0.0 && rc.entry_weight >= 0.0,
            "risk confidence weights must be >= 0");
    require(rc.rr_score_cap > 0.0, "risk.rr_score_cap must be > 0");
    require(rc.tier_b_threshold <= rc.tier_a_threshold, "risk.tier_b_threshold must be <= tier_a_threshold");
}

} // namespace signaldesk
