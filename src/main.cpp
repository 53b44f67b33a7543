#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "core/state/TradeJournalJsonl.h"
#include "engine/TradingDesk.h"
#include "network/CandleFileProvider.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace signaldesk;

namespace {

struct CliOptions {
    std::string command;
    std::string candles_file;
    std::string mode = "auto";
    std::string strategy = "SMC";
    std::string symbol;
    std::string market_type;
    std::string timeframe = "1h";
    std::string direction = "auto";
    std::string config_path = "config/config.json";
    std::string journal_path;
    bool json = false;
};

void printUsage() {
    std::cout << "Usage:\n"
              << "  signaldesk analyze <candles-file> [mode] [strategy] [options]\n"
              << "  signaldesk demo <candles-file> [options]\n"
              << "\n"
              << "mode: scalping | intraday | swing | auto (default auto)\n"
              << "\n"
              << "Options:\n"
              << "  --symbol <SYM>        symbol (default: file name stem)\n"
              << "  --market <type>       crypto | forex | indices | metals | futures | stocks\n"
              << "  --timeframe <tf>      5min, 1h, 4h, 1d ... (default 1h)\n"
              << "  --direction <dir>     buy | sell | auto (default auto)\n"
              << "  --config <path>       config file (default config/config.json)\n"
              << "  --journal <path>      demo: persist trades to this JSONL journal\n"
              << "  --json                machine-readable output\n";
}

std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
    if (argc < 3) {
        return std::nullopt;
    }

    CliOptions opts;
    opts.command = argv[1];
    opts.candles_file = argv[2];

    std::vector<std::string> positional;
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw InvalidArgumentError("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--json") opts.json = true;
        else if (arg == "--symbol") opts.symbol = next();
        else if (arg == "--market") opts.market_type = next();
        else if (arg == "--timeframe") opts.timeframe = next();
        else if (arg == "--direction") opts.direction = next();
        else if (arg == "--config") opts.config_path = next();
        else if (arg == "--journal") opts.journal_path = next();
        else if (arg.rfind("--", 0) == 0) throw InvalidArgumentError("unknown option: " + arg);
        else positional.push_back(arg);
    }

    if (!positional.empty()) opts.mode = positional[0];
    if (positional.size() > 1) opts.strategy = positional[1];

    if (opts.symbol.empty()) {
        // BTC_USD_1h.csv -> BTC/USD
        std::string stem = std::filesystem::path(opts.candles_file).stem().string();
        const std::string suffix = "_" + opts.timeframe;
        if (stem.size() > suffix.size() && stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0) {
            stem = stem.substr(0, stem.size() - suffix.size());
        }
        std::replace(stem.begin(), stem.end(), '_', '/');
        opts.symbol = stem;
    }
    return opts;
}

Direction directionArg(const std::string& value) {
    if (value == "auto" || value == "AUTO") {
        return Direction::NEUTRAL;
    }
    return parseDirection(value);
}

std::string optionalPrice(const common::InstrumentClass instrument, const std::optional<double>& price,
                          const std::string& symbol) {
    return price ? common::formatPrice(instrument, *price, symbol) : std::string("-");
}

nlohmann::json structureToJson(const analytics::StructureSnapshot& s) {
    nlohmann::json j;
    j["trend"] = analytics::toString(s.trend);
    j["price_position"] = analytics::toString(s.price_position);
    j["current_price"] = s.current_price;
    j["atr"] = s.atr;
    j["nearest_support"] = s.nearest_support ? nlohmann::json(*s.nearest_support) : nlohmann::json();
    j["nearest_resistance"] = s.nearest_resistance ? nlohmann::json(*s.nearest_resistance) : nlohmann::json();

    j["swing_points"] = nlohmann::json::array();
    for (const auto& p : s.swing_points) {
        j["swing_points"].push_back({
            {"index", p.index},
            {"price", p.price},
            {"kind", analytics::toString(p.kind)},
            {"broken", p.broken}
        });
    }

    j["order_blocks"] = nlohmann::json::array();
    for (const auto& ob : s.order_blocks) {
        j["order_blocks"].push_back({
            {"entry_zone", ob.entry_zone},
            {"high", ob.high},
            {"low", ob.low},
            {"direction", analytics::toString(ob.direction)},
            {"origin_index", ob.origin_index}
        });
    }

    if (s.last_bos) {
        j["last_bos"] = {
            {"level", s.last_bos->level},
            {"direction", analytics::toString(s.last_bos->direction)},
            {"index", s.last_bos->index}
        };
    } else {
        j["last_bos"] = nullptr;
    }
    return j;
}

nlohmann::json signalToJson(const strategy::Signal& s) {
    nlohmann::json j;
    j["id"] = s.id;
    j["symbol"] = s.symbol;
    j["timeframe"] = s.timeframe;
    j["mode"] = toString(s.mode);
    j["strategy"] = s.strategy;
    j["market_type"] = common::toString(s.instrument);
    j["direction"] = toString(s.direction);
    j["current_price"] = s.current_price;
    j["optimal_entry"] = s.optimal_entry;
    j["entry_type"] = toString(s.entry_type);
    j["stop_loss"] = s.stop_loss;
    j["take_profit_1"] = s.take_profit_1;
    j["take_profit_2"] = s.take_profit_2 ? nlohmann::json(*s.take_profit_2) : nlohmann::json();
    j["take_profit_3"] = s.take_profit_3 ? nlohmann::json(*s.take_profit_3) : nlohmann::json();
    j["rr_ratio"] = s.rr_ratio;
    j["confidence"] = s.confidence;
    j["quality_tier"] = std::string(1, s.quality_tier);
    j["created_at"] = s.created_at;
    j["structure"] = structureToJson(s.structure);
    return j;
}

void printStructure(const analytics::StructureSnapshot& s, common::InstrumentClass instrument, const std::string& symbol) {
    std::cout << "Market structure\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Trend:          " << analytics::toString(s.trend) << "\n";
    std::cout << "Price position: " << analytics::toString(s.price_position) << "\n";
    std::cout << "Current price:  " << common::formatPrice(instrument, s.current_price, symbol) << "\n";
    std::cout << "ATR:            " << common::formatPrice(instrument, s.atr, symbol) << "\n";
    std::cout << "Support:        " << optionalPrice(instrument, s.nearest_support, symbol) << "\n";
    std::cout << "Resistance:     " << optionalPrice(instrument, s.nearest_resistance, symbol) << "\n";
    std::cout << "Swing points:   " << s.swing_points.size() << "\n";
    std::cout << "Order blocks:   " << s.order_blocks.size() << "\n";
    if (s.last_bos) {
        std::cout << "Last BOS:       " << analytics::toString(s.last_bos->direction) << " @ "
                  << common::formatPrice(instrument, s.last_bos->level, symbol)
                  << " (bar " << s.last_bos->index << ")\n";
    }
}

void printSignal(const strategy::Signal& s) {
    auto px = [&](double v) { return common::formatPrice(s.instrument, v, s.symbol); };
    std::cout << "\nSignal " << s.id << "\n";
    std::cout << "---------------------------------------------\n";
    std::cout << s.symbol << " " << s.timeframe << " [" << toString(s.mode) << ", " << s.strategy << "]\n";
    std::cout << "Direction:   " << toString(s.direction) << " (" << toString(s.entry_type) << ")\n";
    std::cout << "Entry:       " << px(s.optimal_entry) << "\n";
    std::cout << "Stop loss:   " << px(s.stop_loss) << "\n";
    std::cout << "TP1:         " << px(s.take_profit_1) << "\n";
    std::cout << "TP2:         " << optionalPrice(s.instrument, s.take_profit_2, s.symbol) << "\n";
    std::cout << "TP3:         " << optionalPrice(s.instrument, s.take_profit_3, s.symbol) << "\n";
    std::cout << "RR:          " << std::fixed << std::setprecision(2) << s.rr_ratio << "\n";
    std::cout << "Confidence:  " << std::setprecision(1) << s.confidence << " (" << s.quality_tier << ")\n";
}

int runAnalyze(const CliOptions& opts, const engine::EngineConfig& config) {
    auto candles = network::CandleFileProvider::loadFile(opts.candles_file);
    const auto instrument = common::resolveInstrumentClass(opts.market_type, opts.symbol);

    const analytics::StructureAnalyzer analyzer(config.structure);
    const auto structure = analyzer.analyze(candles);

    auto provider = std::make_shared<network::CandleFileProvider>();
    provider->addSeries(opts.symbol, opts.timeframe, std::move(candles));
    engine::TradingDesk desk(config, provider);

    std::optional<strategy::Signal> signal;
    std::string no_setup;
    try {
        signal = desk.generateSignal(opts.symbol, opts.timeframe, opts.market_type,
                                     parseTradingMode(opts.mode), opts.strategy,
                                     directionArg(opts.direction));
    } catch (const NoValidSetupError& e) {
        no_setup = e.what();
    }

    if (opts.json) {
        nlohmann::json j;
        j["structure"] = structureToJson(structure);
        j["signal"] = signal ? signalToJson(*signal) : nlohmann::json();
        if (!signal) j["no_setup"] = no_setup;
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    printStructure(structure, instrument, opts.symbol);
    if (signal) {
        printSignal(*signal);
    } else {
        std::cout << "\nNo valid setup: " << no_setup << "\n";
    }
    return 0;
}

int runDemo(const CliOptions& opts, const engine::EngineConfig& config) {
    const auto candles = network::CandleFileProvider::loadFile(opts.candles_file);
    const size_t min_bars = config.structure.min_bars;
    if (candles.size() < min_bars + 1) {
        throw InsufficientDataError(candles.size(), min_bars + 1);
    }

    // 앞 2/3 로 신호 생성, 나머지 봉으로 재생
    const size_t warmup = std::max(min_bars, candles.size() * 2 / 3);

    auto provider = std::make_shared<network::CandleFileProvider>();
    provider->addSeries(opts.symbol, opts.timeframe, candles);
    provider->setCursor(warmup);

    std::shared_ptr<core::ITradeJournal> journal;
    if (!opts.journal_path.empty()) {
        journal = std::make_shared<core::TradeJournalJsonl>(opts.journal_path);
    }
    engine::TradingDesk desk(config, provider, journal);

    const auto signal = desk.generateSignal(opts.symbol, opts.timeframe, opts.market_type,
                                            parseTradingMode(opts.mode), opts.strategy,
                                            directionArg(opts.direction));
    if (!opts.json) printSignal(signal);

    // 자동 진입이 이미 거래를 열었으면 그 거래를 재생
    const auto auto_opened = desk.getTradesForSignal(signal.id);
    const auto trade = auto_opened.empty()
        ? desk.confirmTrade(signal.id, desk.suggestedQuantity(signal))
        : auto_opened.front();
    if (!opts.json) {
        std::cout << "\n" << (auto_opened.empty() ? "Confirmed " : "Auto-executed ") << trade.id
                  << " qty=" << std::setprecision(6) << trade.quantity
                  << " @ " << common::formatPrice(trade.instrument, trade.entry_price, trade.symbol) << "\n";
    }

    // 불리한 극값 -> 유리한 극값 -> 종가 순으로 가격 갱신 (같은 봉이면 손절 우선)
    const bool is_buy = trade.direction == Direction::BUY;
    for (size_t i = provider->cursor(); i < candles.size(); ++i) {
        provider->setCursor(i + 1);
        const auto& bar = candles[i];
        desk.onPriceUpdate(trade.symbol, is_buy ? bar.low : bar.high);
        desk.onPriceUpdate(trade.symbol, is_buy ? bar.high : bar.low);
        desk.onPriceUpdate(trade.symbol, bar.close);
        if (desk.getOpenTrades().empty()) break;
    }

    if (!desk.getOpenTrades().empty()) {
        desk.closeTrade(trade.id, CloseReason::MARKET);
    }

    const auto snapshot = desk.getPortfolioSnapshot();
    const auto curve = desk.getEquityCurve();
    const auto stats = desk.getStrategyStats();

    if (opts.json) {
        nlohmann::json j;
        j["signal"] = signalToJson(signal);
        j["trades"] = nlohmann::json::array();
        for (const auto& t : desk.getClosedTrades()) {
            j["trades"].push_back(engine::toJson(t));
        }
        j["portfolio"] = {
            {"balance", snapshot.balance},
            {"total_pnl", snapshot.total_pnl},
            {"win_rate", snapshot.win_rate},
            {"total_trades", snapshot.total_trades},
            {"open_trades", snapshot.open_trades}
        };
        j["equity_curve"] = nlohmann::json::array();
        for (const auto& p : curve) {
            j["equity_curve"].push_back({{"timestamp", p.timestamp}, {"equity", p.equity}});
        }
        j["strategy_stats"] = nlohmann::json::array();
        for (const auto& s : stats) {
            j["strategy_stats"].push_back({
                {"strategy", s.strategy},
                {"trades", s.trades},
                {"total_pnl", s.total_pnl},
                {"win_rate", s.win_rate},
                {"avg_pnl", s.avg_pnl},
                {"max_win", s.max_win}
            });
        }
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    for (const auto& t : desk.getClosedTrades()) {
        std::cout << "Closed " << t.id << " " << toString(*t.close_reason) << " @ "
                  << common::formatPrice(t.instrument, *t.exit_price, t.symbol)
                  << " pnl=" << std::fixed << std::setprecision(2) << *t.pnl << "\n";
    }

    std::cout << "\nPortfolio\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Balance:     " << std::fixed << std::setprecision(2) << snapshot.balance << "\n";
    std::cout << "Total PnL:   " << snapshot.total_pnl << "\n";
    std::cout << "Win rate:    " << snapshot.win_rate << "%\n";
    std::cout << "Trades:      " << snapshot.total_trades << " (open " << snapshot.open_trades << ")\n";
    std::cout << "Equity:      ";
    for (size_t i = 0; i < curve.size(); ++i) {
        std::cout << (i ? " -> " : "") << curve[i].equity;
    }
    std::cout << "\n";
    for (const auto& s : stats) {
        std::cout << "  - " << s.strategy
                  << " | trades=" << s.trades
                  << " | win=" << std::setprecision(1) << s.win_rate << "%"
                  << " | pnl=" << std::setprecision(2) << s.total_pnl
                  << " | max_win=" << s.max_win << "\n";
    }
    std::cout << "---------------------------------------------\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const auto opts = parseArgs(argc, argv);
        if (!opts || (opts->command != "analyze" && opts->command != "demo")) {
            printUsage();
            return 2;
        }

        const auto config = Config::load(opts->config_path);
        // --json 이면 stdout 은 JSON 문서 전용, 콘솔 로그는 stderr 로 warn 이상만
        Logger::getInstance().initialize(config.log_dir, opts->json ? "warn" : config.log_level, opts->json);

        LOG_INFO("signaldesk {} {} ({} {}, mode {})", opts->command, opts->candles_file,
                 opts->symbol, opts->timeframe, opts->mode);

        if (opts->command == "analyze") {
            return runAnalyze(*opts, config);
        }
        return runDemo(*opts, config);

    } catch (const DeskError& e) {
        LOG_ERROR("{}", e.what());
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << "fatal: " << e.what() << "\n";
        return 1;
    }
}
