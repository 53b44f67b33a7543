#pragma once

#include "common/Types.h"
#include "core/contracts/ITradeJournal.h"
#include "engine/EngineConfig.h"
#include "engine/PortfolioAggregator.h"
#include "engine/PositionLedger.h"
#include "network/IMarketDataProvider.h"
#include "network/LivePriceService.h"
#include "strategy/Signal.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace signaldesk {
namespace engine {

// Trading Desk - 신호 생성부터 청산/집계까지의 외부 진입점
//
// 폴링 루프 없음. 가격 갱신 주기는 호출자(onPriceUpdate)가 정한다.
class TradingDesk {
public:
    using Clock = network::LivePriceService::Clock;

    // journal 이 있으면 생성 시 원장을 재구성한다
    TradingDesk(
        const EngineConfig& config,
        std::shared_ptr<network::IMarketDataProvider> provider,
        std::shared_ptr<core::ITradeJournal> journal = nullptr,
        Clock clock = currentTimestampMs
    );

    // ===== 신호 =====

    // Throws MarketNotAllowedError, InvalidArgumentError, PriceUnavailableError,
    // InsufficientDataError, InvalidCandleError, NoValidSetupError.
    // bot_enabled && auto_execute 이고 등급이 auto_execute_min_tier 이상이면 즉시 진입
    strategy::Signal generateSignal(
        const std::string& symbol,
        const std::string& timeframe,
        const std::string& market_type,
        TradingMode mode,
        const std::string& strategy_name,
        Direction direction = Direction::NEUTRAL
    );

    std::optional<strategy::Signal> findSignal(const std::string& signal_id) const;

    // ===== 진입 / 청산 =====

    // 신호당 한 번만 진입 (자동 진입 포함)
    // Throws SignalNotFoundError, SignalAlreadyConfirmedError, TradeLimitError,
    // PriceUnavailableError, InvalidArgumentError, JournalWriteError.
    Trade confirmTrade(const std::string& signal_id, double quantity);
    Trade confirmTrade(const strategy::Signal& signal, double quantity);

    // MANUAL 은 manual_price 필수, MARKET 은 실시간 가격
    // Throws TradeNotFoundError, TradeAlreadyClosedError, InvalidArgumentError,
    // PriceUnavailableError, JournalWriteError.
    Trade closeTrade(const std::string& trade_id,
                     CloseReason reason,
                     std::optional<double> manual_price = std::nullopt);

    // 외부 피드 가격 반영 + SL/TP 도달 거래 청산
    std::vector<Trade> onPriceUpdate(const std::string& symbol, double price);

    // 잔고 x risk_per_trade / 손절 거리
    double suggestedQuantity(const strategy::Signal& signal) const;

    // ===== 조회 =====

    std::vector<Trade> getOpenTrades() const;
    std::vector<Trade> getClosedTrades() const;
    std::vector<Trade> getTradesForSignal(const std::string& signal_id) const;
    PortfolioSnapshot getPortfolioSnapshot() const;
    std::vector<EquityPoint> getEquityCurve() const;
    std::vector<StrategyStats> getStrategyStats() const;

    // Throws TradeNotFoundError, TradeAlreadyClosedError, PriceUnavailableError.
    double floatingPnl(const std::string& trade_id);

    // ===== 설정 =====

    std::shared_ptr<const EngineConfig> config() const;

    // 전체 값 교체. Throws ConfigError (기존 설정 유지).
    void updateConfig(const EngineConfig& config);

private:
    Trade openFromSignal(const strategy::Signal& signal, double quantity);
    bool tierQualifies(char tier, char min_tier) const { return tier <= min_tier; }

    mutable std::mutex config_mutex_;
    std::shared_ptr<const EngineConfig> config_;

    std::shared_ptr<network::IMarketDataProvider> provider_;
    std::shared_ptr<core::ITradeJournal> journal_;
    Clock clock_;
    network::LivePriceService prices_;
    PositionLedger ledger_;

    mutable std::mutex signals_mutex_;
    std::map<std::string, strategy::Signal> signals_;

    // 일일 한도 확인과 진입을 한 단위로
    std::mutex confirm_mutex_;
};

} // namespace engine
} // namespace signaldesk
