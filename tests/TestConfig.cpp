#include "common/Config.h"
#include "common/Errors.h"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>

using namespace signaldesk;

namespace {
bool rejects(const std::function<void(engine::EngineConfig&)>& mutate) {
    engine::EngineConfig config;
    mutate(config);
    try {
        Config::validate(config);
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}
}

// Simple manual test runner
int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. 기본값
    {
        const engine::EngineConfig config;
        Config::validate(config);
        assert(std::abs(config.initial_capital - 10000.0) < 1e-9);
        assert(std::abs(config.risk_per_trade - 0.02) < 1e-12);
        assert(config.max_daily_trades == 10);
        assert(!config.bot_enabled && !config.auto_execute);
        assert(config.auto_execute_min_tier == 'A');
        assert(config.structure.min_bars == 30);
        assert(config.risk.scalping_stop_multiplier < config.risk.intraday_stop_multiplier);
        assert(config.risk.intraday_stop_multiplier < config.risk.swing_stop_multiplier);
    }

    // 2. JSON 부분 지정: 누락 키는 기본값, 이름 정규화
    {
        const auto j = nlohmann::json::parse(R"({
            "account": { "risk_per_trade": 0.01, "max_daily_trades": 3 },
            "bot": {
                "enabled": true, "auto_execute": true, "auto_execute_min_tier": "b",
                "allowed_markets": ["Crypto", " METALS "],
                "strategies": ["smc"]
            },
            "structure": { "swing_window": 3 },
            "risk": { "min_reward_risk": 2.5 }
        })");
        const auto config = Config::fromJson(j);
        assert(std::abs(config.risk_per_trade - 0.01) < 1e-12);
        assert(config.max_daily_trades == 3);
        assert(std::abs(config.initial_capital - 10000.0) < 1e-9);
        assert(config.bot_enabled && config.auto_execute);
        assert(config.auto_execute_min_tier == 'B');
        assert(config.allowed_markets.size() == 2);
        assert(config.allowed_markets[0] == "crypto");
        assert(config.allowed_markets[1] == "metals");
        assert(config.strategies.size() == 1 && config.strategies[0] == "SMC");
        assert(config.structure.swing_window == 3);
        assert(config.structure.atr_period == 14);
        assert(std::abs(config.risk.min_reward_risk - 2.5) < 1e-12);
    }

    // 3. toJson -> fromJson 보존
    {
        engine::EngineConfig config;
        config.initial_capital = 2500.0;
        config.allowed_markets = {"forex"};
        config.rebase_levels_on_confirm = true;
        const auto restored = Config::fromJson(Config::toJson(config));
        assert(std::abs(restored.initial_capital - 2500.0) < 1e-9);
        assert(restored.allowed_markets.size() == 1 && restored.allowed_markets[0] == "forex");
        assert(restored.rebase_levels_on_confirm);
    }

    // 4. 잘못된 값은 ConfigError
    {
        assert(rejects([](engine::EngineConfig& c) { c.initial_capital = 0.0; }));
        assert(rejects([](engine::EngineConfig& c) { c.risk_per_trade = 1.5; }));
        assert(rejects([](engine::EngineConfig& c) { c.max_daily_trades = 0; }));
        assert(rejects([](engine::EngineConfig& c) { c.auto_execute_min_tier = 'D'; }));
        assert(rejects([](engine::EngineConfig& c) { c.allowed_markets = {"bonds"}; }));
        assert(rejects([](engine::EngineConfig& c) { c.candle_count = 20; }));
        assert(rejects([](engine::EngineConfig& c) { c.price_timeout_ms = 0; }));
        assert(rejects([](engine::EngineConfig& c) { c.structure.premium_threshold = 0.3; }));
        assert(rejects([](engine::EngineConfig& c) { c.risk.swing_stop_multiplier = 0.8; }));
        assert(rejects([](engine::EngineConfig& c) { c.risk.tp2_multiple = 1.5; }));
        assert(rejects([](engine::EngineConfig& c) { c.risk.tier_b_threshold = 90.0; }));

        bool thrown = false;
        try {
            Config::fromJson(nlohmann::json::parse(R"({"account": {"initial_capital": "lots"}})"));
        } catch (const ConfigError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // 5. 파일 로드: 없으면 기본값, 깨진 JSON 은 ConfigError
    {
        const auto dir = std::filesystem::temp_directory_path() / "signaldesk_test_config";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir);

        const auto missing = Config::load((dir / "missing.json").string());
        assert(missing.max_daily_trades == 10);

        const auto broken_path = dir / "broken.json";
        {
            std::ofstream out(broken_path);
            out << "{ \"account\": ";
        }
        bool thrown = false;
        try {
            Config::load(broken_path.string());
        } catch (const ConfigError&) {
            thrown = true;
        }
        assert(thrown);

        const auto good_path = dir / "config.json";
        {
            std::ofstream out(good_path);
            out << R"({"account": {"initial_capital": 5000}})";
        }
        assert(std::abs(Config::load(good_path.string()).initial_capital - 5000.0) < 1e-9);

        std::filesystem::remove_all(dir, ec);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
