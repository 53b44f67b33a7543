#pragma once

#include "engine/Trade.h"
#include <map>
#include <string>
#include <vector>

namespace signaldesk {
namespace engine {

// 항상 Trade 목록에서 다시 계산되는 파생 값 (따로 저장하지 않음)
struct PortfolioSnapshot {
    double initial_capital = 0.0;
    double balance = 0.0;           // initial + realized
    double total_pnl = 0.0;         // realized
    double win_rate = 0.0;          // %, closed 가 없으면 0
    int total_trades = 0;
    int open_trades = 0;
    int closed_trades = 0;
    double unrealized_pnl = 0.0;    // 가격을 아는 OPEN 거래만
    double equity = 0.0;            // balance + unrealized
};

struct EquityPoint {
    long long timestamp = 0;
    double equity = 0.0;
};

struct StrategyStats {
    std::string strategy;
    int trades = 0;
    int wins = 0;
    double total_pnl = 0.0;
    double win_rate = 0.0;          // %
    double avg_pnl = 0.0;
    double max_win = 0.0;           // 최대 단일 수익 (수익 거래가 없으면 0)
};

class PortfolioAggregator {
public:
    explicit PortfolioAggregator(double initial_capital) : initial_capital_(initial_capital) {}

    PortfolioSnapshot snapshot(const std::vector<Trade>& trades,
                               const std::map<std::string, double>& last_prices = {}) const;

    // [initial] + closed 거래를 closed_at 순 (동률은 id 순) 누적
    // 첫 점의 timestamp 는 첫 거래 생성 시각 (거래가 없으면 0)
    std::vector<EquityPoint> equityCurve(const std::vector<Trade>& trades) const;

    // total_pnl 내림차순, 동률은 전략 이름 순
    std::vector<StrategyStats> strategyStats(const std::vector<Trade>& trades) const;

    double initialCapital() const { return initial_capital_; }

private:
    double initial_capital_;
};

} // namespace engine
} // namespace signaldesk
