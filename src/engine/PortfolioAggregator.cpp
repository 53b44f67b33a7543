#include "engine/PortfolioAggregator.h"

#include <algorithm>
#include <limits>

namespace signaldesk {
namespace engine {
namespace {
std::vector<const Trade*> closedByTime(const std::vector<Trade>& trades) {
    std::vector<const Trade*> closed;
    for (const auto& trade : trades) {
        if (!trade.isOpen() && trade.pnl) {
            closed.push_back(&trade);
        }
    }
    std::sort(closed.begin(), closed.end(), [](const Trade* a, const Trade* b) {
        const long long ta = a->closed_at.value_or(0);
        const long long tb = b->closed_at.value_or(0);
        if (ta != tb) return ta < tb;
        return a->id < b->id;
    });
    return closed;
}

void accumulateStats(StrategyStats& s, double pnl) {
    s.trades++;
    s.total_pnl += pnl;
    if (pnl > 0.0) {
        s.wins++;
        s.max_win = std::max(s.max_win, pnl);
    }
}
}

PortfolioSnapshot PortfolioAggregator::snapshot(const std::vector<Trade>& trades,
                                                const std::map<std::string, double>& last_prices) const {
    PortfolioSnapshot s;
    s.initial_capital = initial_capital_;
    s.total_trades = static_cast<int>(trades.size());

    int wins = 0;
    for (const auto& trade : trades) {
        if (trade.isOpen()) {
            s.open_trades++;
            auto it = last_prices.find(trade.symbol);
            if (it != last_prices.end()) {
                s.unrealized_pnl += trade.pnlAt(it->second);
            }
            continue;
        }
        s.closed_trades++;
        const double pnl = trade.pnl.value_or(0.0);
        s.total_pnl += pnl;
        if (pnl > 0.0) wins++;
    }

    s.balance = initial_capital_ + s.total_pnl;
    s.win_rate = s.closed_trades > 0
        ? static_cast<double>(wins) / static_cast<double>(s.closed_trades) * 100.0
        : 0.0;
    s.equity = s.balance + s.unrealized_pnl;
    return s;
}

std::vector<EquityPoint> PortfolioAggregator::equityCurve(const std::vector<Trade>& trades) const {
    std::vector<EquityPoint> curve;

    long long first_ts = std::numeric_limits<long long>::max();
    for (const auto& trade : trades) {
        first_ts = std::min(first_ts, trade.created_at);
    }
    if (trades.empty()) first_ts = 0;

    curve.push_back({first_ts, initial_capital_});

    double equity = initial_capital_;
    for (const Trade* trade : closedByTime(trades)) {
        equity += *trade->pnl;
        curve.push_back({trade->closed_at.value_or(0), equity});
    }
    return curve;
}

std::vector<StrategyStats> PortfolioAggregator::strategyStats(const std::vector<Trade>& trades) const {
    std::map<std::string, StrategyStats> by_strategy;
    for (const auto& trade : trades) {
        if (trade.isOpen() || !trade.pnl) continue;
        const std::string name = trade.strategy.empty() ? "unknown" : trade.strategy;
        auto& s = by_strategy[name];
        s.strategy = name;
        accumulateStats(s, *trade.pnl);
    }

    std::vector<StrategyStats> out;
    out.reserve(by_strategy.size());
    for (auto& [name, s] : by_strategy) {
        s.avg_pnl = s.trades > 0 ? s.total_pnl / static_cast<double>(s.trades) : 0.0;
        s.win_rate = s.trades > 0 ? static_cast<double>(s.wins) / static_cast<double>(s.trades) * 100.0 : 0.0;
        out.push_back(s);
    }

    std::sort(out.begin(), out.end(), [](const StrategyStats& a, const StrategyStats& b) {
        if (a.total_pnl != b.total_pnl) return a.total_pnl > b.total_pnl;
        return a.strategy < b.strategy;
    });
    return out;
}

} // namespace engine
} // namespace signaldesk
