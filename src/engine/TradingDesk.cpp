#include "engine/TradingDesk.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/InstrumentClass.h"
#include "common/Logger.h"
#include "risk/RiskEngine.h"
#include "strategy/SignalFactory.h"

#include <algorithm>
#include <cctype>

namespace signaldesk {
namespace engine {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

TradingDesk::TradingDesk(
    const EngineConfig& config,
    std::shared_ptr<network::IMarketDataProvider> provider,
    std::shared_ptr<core::ITradeJournal> journal,
    Clock clock
)
    : config_(std::make_shared<const EngineConfig>(config))
    , provider_(provider)
    , journal_(journal)
    , clock_(clock)
    , prices_(provider, config.price_timeout_ms, config.price_freshness_ms, clock)
    , ledger_(journal)
{
    Config::validate(config);

    if (journal_) {
        ledger_.restore(*journal_);
    }

    LOG_INFO("TradingDesk ready - capital {:.2f}, risk/trade {:.2f}%, max {} trades/day, auto_execute={}",
             config.initial_capital, config.risk_per_trade * 100.0, config.max_daily_trades,
             config.bot_enabled && config.auto_execute);
}

// ===== 신호 =====

strategy::Signal TradingDesk::generateSignal(
    const std::string& symbol,
    const std::string& timeframe,
    const std::string& market_type,
    TradingMode mode,
    const std::string& strategy_name,
    Direction direction
) {
    const auto cfg = config();

    // 1) 시장 분류 / 허용 여부
    common::InstrumentClass instrument = common::InstrumentClass::CRYPTO;
    if (market_type.empty()) {
        instrument = common::inferInstrumentClass(symbol);
    } else if (!common::parseInstrumentClass(market_type, instrument)) {
        throw InvalidArgumentError("unknown market type: " + market_type);
    }
    const std::string market_name = common::toString(instrument);
    const bool allowed = std::any_of(cfg->allowed_markets.begin(), cfg->allowed_markets.end(),
        [&](const std::string& m) {
            common::InstrumentClass parsed;
            return common::parseInstrumentClass(m, parsed) && parsed == instrument;
        });
    if (!allowed) {
        throw MarketNotAllowedError("market class '" + market_name + "' is not allowed (" + symbol + ")");
    }

    // 2) 전략 태그
    const std::string strategy_tag = toUpperCopy(strategy_name.empty() ? std::string("SMC") : strategy_name);
    const bool enabled = cfg->strategies.empty() ||
        std::any_of(cfg->strategies.begin(), cfg->strategies.end(),
                    [&](const std::string& s) { return toUpperCopy(s) == strategy_tag; });
    if (!enabled) {
        throw InvalidArgumentError("strategy '" + strategy_tag + "' is not enabled");
    }

    // 3) 캔들 -> 신호
    const auto candles = provider_->fetchCandles(symbol, timeframe, cfg->candle_count);

    strategy::SignalRequest request;
    request.symbol = symbol;
    request.timeframe = timeframe;
    request.market_type = market_name;
    request.mode = mode;
    request.strategy = strategy_tag;
    request.direction = direction;

    const strategy::SignalFactory factory(cfg->structure, cfg->risk);
    const auto signal = factory.create(request, candles, clock_());

    {
        std::lock_guard<std::mutex> lock(signals_mutex_);
        signals_[signal.id] = signal;
    }

    // 4) 자동 진입
    if (cfg->bot_enabled && cfg->auto_execute) {
        if (!tierQualifies(signal.quality_tier, cfg->auto_execute_min_tier)) {
            LOG_INFO("Auto-execute skipped for {}: tier {} below {}",
                     signal.id, signal.quality_tier, cfg->auto_execute_min_tier);
        } else {
            const double quantity = suggestedQuantity(signal);
            if (quantity <= 0.0) {
                LOG_WARN("Auto-execute skipped for {}: zero position size", signal.id);
            } else {
                try {
                    openFromSignal(signal, quantity);
                } catch (const TradeLimitError& e) {
                    LOG_WARN("Auto-execute skipped for {}: {}", signal.id, e.what());
                } catch (const PriceUnavailableError& e) {
                    LOG_WARN("Auto-execute skipped for {}: {}", signal.id, e.what());
                } catch (const JournalWriteError& e) {
                    // 신호는 이미 등록됨 - 호출자가 id 로 다시 확인할 수 있다
                    LOG_ERROR("Auto-execute failed for {}: {}", signal.id, e.what());
                }
            }
        }
    }

    return signal;
}

std::optional<strategy::Signal> TradingDesk::findSignal(const std::string& signal_id) const {
    std::lock_guard<std::mutex> lock(signals_mutex_);
    auto it = signals_.find(signal_id);
    if (it == signals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ===== 진입 / 청산 =====

Trade TradingDesk::confirmTrade(const std::string& signal_id, double quantity) {
    const auto signal = findSignal(signal_id);
    if (!signal) {
        throw SignalNotFoundError(signal_id);
    }
    return openFromSignal(*signal, quantity);
}

Trade TradingDesk::confirmTrade(const strategy::Signal& signal, double quantity) {
    if (signal.id.empty()) {
        throw InvalidArgumentError("signal payload has no id");
    }
    if (signal.direction == Direction::NEUTRAL) {
        throw InvalidArgumentError("cannot confirm a NEUTRAL signal");
    }
    {
        std::lock_guard<std::mutex> lock(signals_mutex_);
        signals_.emplace(signal.id, signal);
    }
    return openFromSignal(signal, quantity);
}

Trade TradingDesk::openFromSignal(const strategy::Signal& signal, double quantity) {
    const auto cfg = config();

    std::lock_guard<std::mutex> lock(confirm_mutex_);

    if (const auto existing = ledger_.findBySignal(signal.id)) {
        throw SignalAlreadyConfirmedError(signal.id, existing->id);
    }

    const long long now = clock_();
    const int opened_today = ledger_.countOpenedOnUtcDay(now);
    if (opened_today >= cfg->max_daily_trades) {
        throw TradeLimitError("daily trade limit reached (" + std::to_string(opened_today) + "/" +
                              std::to_string(cfg->max_daily_trades) + ")");
    }

    // 진입가는 신호 가격이 아닌 확인 시점의 실시간 가격
    const auto quote = prices_.getQuote(signal.symbol);
    if (quote.from_cache) {
        LOG_WARN("Confirming {} with cached price {}", signal.id, quote.price);
    }

    return ledger_.open(signal, quantity, quote.price, now, cfg->rebase_levels_on_confirm);
}

Trade TradingDesk::closeTrade(const std::string& trade_id,
                              CloseReason reason,
                              std::optional<double> manual_price) {
    const long long now = clock_();

    switch (reason) {
        case CloseReason::MANUAL:
            if (!manual_price) {
                throw InvalidArgumentError("manual close requires a price");
            }
            return ledger_.closeWithPolicy(trade_id, reason, manual_price, now);
        case CloseReason::MARKET: {
            const auto trade = ledger_.getTrade(trade_id);
            if (!trade.isOpen()) {
                throw TradeAlreadyClosedError(trade_id);
            }
            return ledger_.closeWithPolicy(trade_id, reason, prices_.getPrice(trade.symbol), now);
        }
        case CloseReason::STOP_LOSS:
        case CloseReason::TAKE_PROFIT:
            return ledger_.closeWithPolicy(trade_id, reason, std::nullopt, now);
    }
    throw InvalidArgumentError("unsupported close reason");
}

std::vector<Trade> TradingDesk::onPriceUpdate(const std::string& symbol, double price) {
    prices_.recordPrice(symbol, price);
    return ledger_.checkExits(symbol, price, clock_());
}

double TradingDesk::suggestedQuantity(const strategy::Signal& signal) const {
    const auto cfg = config();
    const auto snapshot = getPortfolioSnapshot();
    return risk::RiskEngine::positionSize(snapshot.balance, cfg->risk_per_trade,
                                          signal.optimal_entry, signal.stop_loss);
}

// ===== 조회 =====

std::vector<Trade> TradingDesk::getOpenTrades() const {
    return ledger_.getOpenTrades();
}

std::vector<Trade> TradingDesk::getClosedTrades() const {
    return ledger_.getClosedTrades();
}

std::vector<Trade> TradingDesk::getTradesForSignal(const std::string& signal_id) const {
    std::vector<Trade> out;
    for (const auto& trade : ledger_.getAllTrades()) {
        if (trade.signal_id == signal_id) out.push_back(trade);
    }
    return out;
}

PortfolioSnapshot TradingDesk::getPortfolioSnapshot() const {
    const PortfolioAggregator aggregator(config()->initial_capital);
    return aggregator.snapshot(ledger_.getAllTrades(), prices_.lastPrices());
}

std::vector<EquityPoint> TradingDesk::getEquityCurve() const {
    const PortfolioAggregator aggregator(config()->initial_capital);
    return aggregator.equityCurve(ledger_.getAllTrades());
}

std::vector<StrategyStats> TradingDesk::getStrategyStats() const {
    const PortfolioAggregator aggregator(config()->initial_capital);
    return aggregator.strategyStats(ledger_.getAllTrades());
}

double TradingDesk::floatingPnl(const std::string& trade_id) {
    const auto trade = ledger_.getTrade(trade_id);
    if (!trade.isOpen()) {
        throw TradeAlreadyClosedError(trade_id);
    }
    return ledger_.floatingPnl(trade_id, prices_.getPrice(trade.symbol));
}

// ===== 설정 =====

std::shared_ptr<const EngineConfig> TradingDesk::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void TradingDesk::updateConfig(const EngineConfig& config) {
    Config::validate(config);

    auto next = std::make_shared<const EngineConfig>(config);
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = next;
    }
    prices_.setLimits(config.price_timeout_ms, config.price_freshness_ms);

    std::string markets;
    for (const auto& m : config.allowed_markets) {
        if (!markets.empty()) markets += ",";
        markets += m;
    }
    LOG_INFO("Config replaced: risk/trade {:.2f}%, max {} trades/day, markets [{}], auto_execute={}",
             config.risk_per_trade * 100.0, config.max_daily_trades, markets,
             config.bot_enabled && config.auto_execute);
}

} // namespace engine
} // namespace signaldesk
