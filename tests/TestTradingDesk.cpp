#include "common/Errors.h"
#include "engine/TradingDesk.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>
#include <memory>

using namespace signaldesk;
using engine::EngineConfig;
using engine::TradingDesk;
using test::near;

namespace {

template <typename Error, typename Fn>
bool throwsAs(Fn fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

strategy::Signal btcSignal(TradingDesk& desk) {
    return desk.generateSignal("BTC/USD", "1h", "crypto", TradingMode::INTRADAY, "SMC");
}

std::shared_ptr<test::FakeMarketData> makeProvider() {
    auto provider = std::make_shared<test::FakeMarketData>();
    provider->setSeries("BTC/USD", test::uptrendScenario());
    provider->setSeries("EUR/USD", test::uptrendScenario());
    provider->setPrice("BTC/USD", 130.5);
    return provider;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting TradingDesk Test..." << std::endl;

    long long now = test::kBaseTime;
    auto clock = [&now] { return now; };

    // 1. 신호 -> 확인 -> 청산 -> 집계
    {
        auto provider = makeProvider();
        auto journal = std::make_shared<test::MemoryJournal>();
        TradingDesk desk(EngineConfig(), provider, journal, clock);

        const auto signal = desk.generateSignal("BTC/USD", "1h", "crypto", TradingMode::INTRADAY, "smc");
        assert(signal.direction == Direction::BUY);
        assert(signal.strategy == "SMC");
        assert(signal.created_at == now);
        assert(desk.findSignal(signal.id).has_value());
        assert(desk.getOpenTrades().empty());

        // 잔고 x 2% / 손절 거리
        const double qty = desk.suggestedQuantity(signal);
        assert(near(qty, 200.0 / (signal.optimal_entry - signal.stop_loss)));

        const auto trade = desk.confirmTrade(signal.id, 1.0);
        assert(trade.signal_id == signal.id);
        assert(near(trade.entry_price, 130.5));           // 확인 시점 가격
        assert(near(trade.stop_loss, signal.stop_loss));
        assert(desk.getOpenTrades().size() == 1);
        assert(desk.getTradesForSignal(signal.id).size() == 1);

        provider->setPrice("BTC/USD", 131.0);
        assert(near(desk.floatingPnl(trade.id), 0.5));

        assert(throwsAs<InvalidArgumentError>([&] {
            desk.closeTrade(trade.id, CloseReason::MANUAL);
        }));

        now += 60000;
        const auto closed = desk.closeTrade(trade.id, CloseReason::MANUAL, 140.0);
        assert(near(*closed.pnl, 9.5));
        assert(*closed.closed_at == now);
        assert(throwsAs<TradeAlreadyClosedError>([&] {
            desk.closeTrade(trade.id, CloseReason::MARKET);
        }));

        const auto snap = desk.getPortfolioSnapshot();
        assert(snap.closed_trades == 1 && snap.open_trades == 0);
        assert(near(snap.total_pnl, 9.5));
        assert(near(snap.win_rate, 100.0));

        const auto curve = desk.getEquityCurve();
        assert(curve.size() == 2);
        assert(near(curve.back().equity, 10009.5));

        const auto stats = desk.getStrategyStats();
        assert(stats.size() == 1 && stats[0].strategy == "SMC");

        assert(journal->lastSeq() == 2);
    }

    // 2. 입력 거부
    {
        TradingDesk desk(EngineConfig(), makeProvider(), nullptr, clock);

        assert(throwsAs<MarketNotAllowedError>([&] {
            desk.generateSignal("XAU/USD", "1h", "metals", TradingMode::INTRADAY, "SMC");
        }));
        assert(throwsAs<InvalidArgumentError>([&] {
            desk.generateSignal("BTC/USD", "1h", "bonds", TradingMode::INTRADAY, "SMC");
        }));
        assert(throwsAs<InvalidArgumentError>([&] {
            desk.generateSignal("BTC/USD", "1h", "crypto", TradingMode::INTRADAY, "TURTLE");
        }));
        assert(throwsAs<PriceUnavailableError>([&] {
            desk.generateSignal("SOL/USD", "1h", "crypto", TradingMode::INTRADAY, "SMC");
        }));
        assert(throwsAs<SignalNotFoundError>([&] { desk.confirmTrade("no-such-signal", 1.0); }));
        assert(throwsAs<TradeNotFoundError>([&] {
            desk.closeTrade("no-such-trade", CloseReason::MANUAL, 100.0);
        }));

        // 신호 payload 직접 확인
        strategy::Signal neutral;
        neutral.id = "manual";
        assert(throwsAs<InvalidArgumentError>([&] { desk.confirmTrade(neutral, 1.0); }));
    }

    // 3. 일일 진입 한도 (UTC 일 기준)
    {
        EngineConfig config;
        config.max_daily_trades = 2;
        TradingDesk desk(config, makeProvider(), nullptr, clock);

        desk.confirmTrade(btcSignal(desk).id, 1.0);
        desk.confirmTrade(btcSignal(desk).id, 1.0);
        const auto third = btcSignal(desk);
        assert(throwsAs<TradeLimitError>([&] { desk.confirmTrade(third.id, 1.0); }));
        assert(desk.getOpenTrades().size() == 2);

        // 한도로 거부된 신호는 다음 날 확인 가능
        now += 86400000LL;
        desk.confirmTrade(third.id, 1.0);
        assert(desk.getOpenTrades().size() == 3);
    }

    // 4. 가격 피드: SL 도달 시 자동 청산, MARKET 청산은 실시간 가격
    {
        auto provider = makeProvider();
        TradingDesk desk(EngineConfig(), provider, nullptr, clock);
        const auto signal = btcSignal(desk);
        const auto first = desk.confirmTrade(signal.id, 1.0);
        const auto second = desk.confirmTrade(btcSignal(desk).id, 1.0);

        provider->setPrice("BTC/USD", 135.0);
        const auto market = desk.closeTrade(second.id, CloseReason::MARKET);
        assert(near(*market.exit_price, 135.0));
        assert(*market.close_reason == CloseReason::MARKET);

        assert(desk.onPriceUpdate("BTC/USD", 120.0).empty());
        const auto exits = desk.onPriceUpdate("BTC/USD", 95.0);
        assert(exits.size() == 1 && exits[0].id == first.id);
        assert(*exits[0].close_reason == CloseReason::STOP_LOSS);
        assert(near(*exits[0].exit_price, signal.stop_loss));

        // 미실현 손익은 마지막 가격 기준
        const auto open = desk.confirmTrade(btcSignal(desk).id, 2.0);
        desk.onPriceUpdate("BTC/USD", 136.0);
        const auto snap = desk.getPortfolioSnapshot();
        assert(near(snap.unrealized_pnl, (136.0 - open.entry_price) * 2.0));
    }

    // 5. 시세 실패: 캐시 없으면 진입 불가, 상태 변화 없음
    {
        auto provider = makeProvider();
        TradingDesk desk(EngineConfig(), provider, nullptr, clock);
        const auto signal = desk.generateSignal("BTC/USD", "1h", "crypto", TradingMode::INTRADAY, "SMC");

        provider->failing = true;
        assert(throwsAs<PriceUnavailableError>([&] { desk.confirmTrade(signal.id, 1.0); }));
        assert(desk.getOpenTrades().empty());

        // freshness 안의 외부 피드 가격이 있으면 그 가격으로
        desk.onPriceUpdate("BTC/USD", 129.0);
        const auto trade = desk.confirmTrade(signal.id, 1.0);
        assert(near(trade.entry_price, 129.0));
    }

    // 6. 자동 진입: bot_enabled && auto_execute, 등급 조건
    {
        EngineConfig config;
        config.auto_execute = true;
        TradingDesk off(config, makeProvider(), nullptr, clock);
        off.generateSignal("BTC/USD", "1h", "crypto", TradingMode::INTRADAY, "SMC");
        assert(off.getOpenTrades().empty());

        config.bot_enabled = true;
        TradingDesk on(config, makeProvider(), nullptr, clock);
        const auto signal = on.generateSignal("BTC/USD", "1h", "crypto", TradingMode::INTRADAY, "SMC");
        assert(signal.quality_tier == 'A');
        const auto trades = on.getOpenTrades();
        assert(trades.size() == 1);
        assert(trades[0].signal_id == signal.id);
        assert(near(trades[0].quantity, on.suggestedQuantity(signal)));
    }

    // 7. 설정 교체: 잘못된 값은 거부하고 기존 값 유지
    {
        TradingDesk desk(EngineConfig(), makeProvider(), nullptr, clock);
        const auto before = desk.config();

        EngineConfig bad;
        bad.risk_per_trade = 0.0;
        assert(throwsAs<ConfigError>([&] { desk.updateConfig(bad); }));
        assert(desk.config() == before);

        EngineConfig next;
        next.allowed_markets = {"forex"};
        desk.updateConfig(next);
        assert(desk.config()->allowed_markets.size() == 1);
        // 이전 스냅샷은 그대로
        assert(before->allowed_markets.size() == 3);

        assert(throwsAs<MarketNotAllowedError>([&] {
            desk.generateSignal("BTC/USD", "1h", "crypto", TradingMode::INTRADAY, "SMC");
        }));
        // 시장 분류 생략 -> 심볼로 추정 (EUR/USD -> forex)
        const auto fx = desk.generateSignal("EUR/USD", "1h", "", TradingMode::INTRADAY, "SMC");
        assert(fx.instrument == common::InstrumentClass::FOREX);
    }

    // 8. 저널로 재시작 복원
    {
        auto journal = std::make_shared<test::MemoryJournal>();
        std::string trade_id;
        {
            TradingDesk desk(EngineConfig(), makeProvider(), journal, clock);
            const auto signal = desk.generateSignal("BTC/USD", "1h", "crypto", TradingMode::INTRADAY, "SMC");
            trade_id = desk.confirmTrade(signal.id, 1.0).id;
        }
        TradingDesk restored(EngineConfig(), makeProvider(), journal, clock);
        const auto open = restored.getOpenTrades();
        assert(open.size() == 1 && open[0].id == trade_id);
        const auto closed = restored.closeTrade(trade_id, CloseReason::TAKE_PROFIT);
        assert(near(*closed.exit_price, closed.take_profit));
    }

    // 9. 신호 하나에 거래 하나: 수동/payload/자동 진입/재시작 모두
    {
        auto journal = std::make_shared<test::MemoryJournal>();
        TradingDesk desk(EngineConfig(), makeProvider(), journal, clock);
        const auto signal = btcSignal(desk);
        const auto trade = desk.confirmTrade(signal.id, 1.0);

        assert(throwsAs<SignalAlreadyConfirmedError>([&] { desk.confirmTrade(signal.id, 1.0); }));
        assert(throwsAs<SignalAlreadyConfirmedError>([&] { desk.confirmTrade(signal, 1.0); }));

        // 청산된 뒤에도 같은 신호로 재진입 불가
        desk.closeTrade(trade.id, CloseReason::MANUAL, 131.0);
        try {
            desk.confirmTrade(signal.id, 1.0);
            assert(false);
        } catch (const SignalAlreadyConfirmedError& e) {
            assert(e.tradeId() == trade.id);
        }
        assert(desk.getTradesForSignal(signal.id).size() == 1);

        TradingDesk restored(EngineConfig(), makeProvider(), journal, clock);
        assert(throwsAs<SignalAlreadyConfirmedError>([&] { restored.confirmTrade(signal, 1.0); }));

        EngineConfig config;
        config.bot_enabled = true;
        config.auto_execute = true;
        TradingDesk autoDesk(config, makeProvider(), nullptr, clock);
        const auto auto_signal = btcSignal(autoDesk);
        assert(autoDesk.getTradesForSignal(auto_signal.id).size() == 1);
        assert(throwsAs<SignalAlreadyConfirmedError>([&] { autoDesk.confirmTrade(auto_signal.id, 1.0); }));
        assert(autoDesk.getTradesForSignal(auto_signal.id).size() == 1);
    }

    // 10. 자동 진입 중 저널 실패: 신호는 반환되고 나중에 수동 확인
    {
        auto journal = std::make_shared<test::MemoryJournal>();
        EngineConfig config;
        config.bot_enabled = true;
        config.auto_execute = true;
        TradingDesk desk(config, makeProvider(), journal, clock);

        journal->fail_appends = true;
        const auto signal = btcSignal(desk);
        assert(desk.findSignal(signal.id).has_value());
        assert(desk.getOpenTrades().empty());

        journal->fail_appends = false;
        const auto trade = desk.confirmTrade(signal.id, 1.0);
        assert(trade.signal_id == signal.id);
        assert(journal->lastSeq() == 1);
    }

    std::cout << "[TEST] TradingDesk Test PASSED!" << std::endl;
    return 0;
}
