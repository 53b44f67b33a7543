#include "engine/PositionLedger.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <cmath>

namespace signaldesk {
namespace engine {

namespace {
bool isValidPrice(double price) {
    return std::isfinite(price) && price > 0.0;
}
}

PositionLedger::PositionLedger(std::shared_ptr<core::ITradeJournal> journal)
    : journal_(std::move(journal))
{
}

Trade PositionLedger::open(const strategy::Signal& signal,
                           double quantity,
                           double live_price,
                           long long now_ms,
                           bool rebase_levels) {
    if (signal.direction == Direction::NEUTRAL) {
        throw InvalidArgumentError("cannot open a trade from a NEUTRAL signal");
    }
    if (!std::isfinite(quantity) || quantity <= 0.0) {
        throw InvalidArgumentError("quantity must be > 0");
    }
    if (!isValidPrice(live_price)) {
        throw InvalidArgumentError("invalid live price for " + signal.symbol);
    }

    Trade trade;
    trade.id = generateId();
    trade.signal_id = signal.id;
    trade.symbol = signal.symbol;
    trade.direction = signal.direction;
    trade.mode = signal.mode;
    trade.instrument = signal.instrument;
    trade.strategy = signal.strategy;
    trade.entry_price = live_price;
    trade.quantity = quantity;
    trade.status = TradeStatus::OPEN;
    trade.created_at = now_ms;

    if (rebase_levels) {
        // 신호 entry 와의 거리를 유지한 채 실시간 가격 기준으로 이동
        const double shift = live_price - signal.optimal_entry;
        auto rebase = [&](double level) {
            return common::roundPrice(signal.instrument, level + shift, signal.symbol);
        };
        trade.stop_loss = rebase(signal.stop_loss);
        trade.take_profit = rebase(signal.take_profit_1);
        if (signal.take_profit_2) trade.take_profit_2 = rebase(*signal.take_profit_2);
    } else {
        trade.stop_loss = signal.stop_loss;
        trade.take_profit = signal.take_profit_1;
        trade.take_profit_2 = signal.take_profit_2;
    }

    const double sign = directionSign(trade.direction);
    if ((trade.entry_price - trade.stop_loss) * sign <= 0.0 ||
        (trade.take_profit - trade.entry_price) * sign <= 0.0) {
        LOG_WARN("Trade {} {} opened at {} outside its levels (SL {}, TP {})",
                 trade.symbol, toString(trade.direction), trade.entry_price,
                 trade.stop_loss, trade.take_profit);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        appendOrThrow(core::TradeEventType::TRADE_OPENED, trade, now_ms);
        trades_[trade.id] = trade;
        order_.push_back(trade.id);
    }

    LOG_INFO("Trade opened: {} {} {} qty={} @ {} (SL {}, TP {}, signal {})",
             trade.id, trade.symbol, toString(trade.direction), trade.quantity,
             common::formatPrice(trade.instrument, trade.entry_price, trade.symbol),
             common::formatPrice(trade.instrument, trade.stop_loss, trade.symbol),
             common::formatPrice(trade.instrument, trade.take_profit, trade.symbol),
             trade.signal_id);
    Logger::getInstance().logTrade("OPEN", trade.id, trade.symbol, toString(trade.direction),
                                   trade.entry_price, trade.quantity, 0.0);
    return trade;
}

Trade PositionLedger::close(const std::string& trade_id, CloseReason reason, double exit_price, long long now_ms) {
    if (!isValidPrice(exit_price)) {
        throw InvalidArgumentError("invalid exit price for trade " + trade_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        throw TradeNotFoundError(trade_id);
    }
    if (!it->second.isOpen()) {
        throw TradeAlreadyClosedError(trade_id);
    }
    return closeLocked(it->second, reason, exit_price, now_ms);
}

Trade PositionLedger::closeWithPolicy(const std::string& trade_id,
                                      CloseReason reason,
                                      std::optional<double> supplied_price,
                                      long long now_ms) {
    double exit_price = 0.0;
    switch (reason) {
        case CloseReason::MANUAL:
        case CloseReason::MARKET:
            if (!supplied_price) {
                throw InvalidArgumentError(toString(reason) + " close requires a price");
            }
            exit_price = *supplied_price;
            break;
        case CloseReason::STOP_LOSS:
        case CloseReason::TAKE_PROFIT: {
            // 거래 자신의 레벨 (조회와 청산 사이에 다른 close 가 끼어들면 close 가 거부한다)
            const Trade trade = getTrade(trade_id);
            exit_price = reason == CloseReason::STOP_LOSS ? trade.stop_loss : trade.take_profit;
            break;
        }
    }
    return close(trade_id, reason, exit_price, now_ms);
}

double PositionLedger::floatingPnl(const std::string& trade_id, double price) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        throw TradeNotFoundError(trade_id);
    }
    if (!it->second.isOpen()) {
        throw TradeAlreadyClosedError(trade_id);
    }
    return it->second.pnlAt(price);
}

std::vector<Trade> PositionLedger::checkExits(const std::string& symbol, double price, long long now_ms) {
    std::vector<Trade> closed;
    if (!isValidPrice(price)) {
        return closed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : order_) {
        auto& trade = trades_.at(id);
        if (!trade.isOpen() || trade.symbol != symbol) continue;

        const bool is_buy = trade.direction == Direction::BUY;
        const bool stop_hit = is_buy ? price <= trade.stop_loss : price >= trade.stop_loss;
        const bool target_hit = is_buy ? price >= trade.take_profit : price <= trade.take_profit;

        try {
            if (stop_hit) {
                closed.push_back(closeLocked(trade, CloseReason::STOP_LOSS, trade.stop_loss, now_ms));
            } else if (target_hit) {
                closed.push_back(closeLocked(trade, CloseReason::TAKE_PROFIT, trade.take_profit, now_ms));
            }
        } catch (const JournalWriteError& e) {
            // 이 거래는 OPEN 유지, 다음 가격 갱신 때 다시 시도
            LOG_ERROR("Exit for trade {} not recorded: {}", trade.id, e.what());
        }
    }
    return closed;
}

size_t PositionLedger::restore(core::ITradeJournal& journal) {
    std::map<std::string, Trade> trades;
    std::vector<std::string> order;

    for (const auto& event : journal.readFrom(0)) {
        Trade trade;
        try {
            trade = tradeFromJson(event.payload);
        } catch (const InvalidArgumentError& e) {
            LOG_WARN("Skipping journal event seq={}: {}", event.seq, e.what());
            continue;
        }

        auto it = trades.find(trade.id);
        if (it == trades.end()) {
            if (event.type == core::TradeEventType::TRADE_CLOSED) {
                LOG_WARN("Journal close event for unknown trade {} (seq={})", trade.id, event.seq);
            }
            order.push_back(trade.id);
            trades.emplace(trade.id, trade);
        } else if (event.type == core::TradeEventType::TRADE_CLOSED && it->second.isOpen()) {
            it->second = trade;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    trades_ = std::move(trades);
    order_ = std::move(order);
    LOG_INFO("Ledger restored: {} trade(s) from journal", order_.size());
    return order_.size();
}

Trade PositionLedger::getTrade(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        throw TradeNotFoundError(trade_id);
    }
    return it->second;
}

std::vector<Trade> PositionLedger::getOpenTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trade> out;
    for (const auto& id : order_) {
        const auto& trade = trades_.at(id);
        if (trade.isOpen()) out.push_back(trade);
    }
    return out;
}

std::vector<Trade> PositionLedger::getClosedTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trade> out;
    for (const auto& id : order_) {
        const auto& trade = trades_.at(id);
        if (!trade.isOpen()) out.push_back(trade);
    }
    return out;
}

std::vector<Trade> PositionLedger::getAllTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trade> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(trades_.at(id));
    }
    return out;
}

std::optional<Trade> PositionLedger::findBySignal(const std::string& signal_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, trade] : trades_) {
        if (trade.signal_id == signal_id) return trade;
    }
    return std::nullopt;
}

int PositionLedger::countOpenedOnUtcDay(long long ts_ms) const {
    const long long day = utcDay(ts_ms);
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& [id, trade] : trades_) {
        if (utcDay(trade.created_at) == day) ++count;
    }
    return count;
}

Trade PositionLedger::closeLocked(Trade& trade, CloseReason reason, double exit_price, long long now_ms) {
    Trade closed = trade;
    closed.status = TradeStatus::CLOSED;
    closed.exit_price = exit_price;
    closed.pnl = trade.pnlAt(exit_price);
    closed.closed_at = now_ms;
    closed.close_reason = reason;

    // 기록 성공 후에만 원장 반영
    appendOrThrow(core::TradeEventType::TRADE_CLOSED, closed, now_ms);
    trade = closed;

    LOG_INFO("Trade closed: {} {} {} {} @ {} pnl={:.2f}",
             closed.id, closed.symbol, toString(closed.direction), toString(reason),
             common::formatPrice(closed.instrument, exit_price, closed.symbol), *closed.pnl);
    Logger::getInstance().logTrade("CLOSE", closed.id, closed.symbol, toString(closed.direction),
                                   exit_price, closed.quantity, *closed.pnl);
    return closed;
}

void PositionLedger::appendOrThrow(core::TradeEventType type, const Trade& trade, long long ts_ms) {
    if (!journal_) {
        return;
    }

    core::TradeEvent event;
    event.ts_ms = ts_ms;
    event.type = type;
    event.symbol = trade.symbol;
    event.trade_id = trade.id;
    event.payload = toJson(trade);

    if (!journal_->append(event)) {
        throw JournalWriteError("journal append failed for trade " + trade.id);
    }
}

} // namespace engine
} // namespace signaldesk
