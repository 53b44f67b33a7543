#pragma once

#include "core/contracts/ITradeJournal.h"
#include "engine/Trade.h"
#include "strategy/Signal.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace signaldesk {
namespace engine {

// Position Ledger - Trade 상태 머신 (OPEN -> CLOSED, 한 번만)
//
// 모든 전이는 하나의 ledger mutex 로 직렬화된다.
// 저널이 있으면 기록이 먼저, 메모리 전이는 그 다음 (기록 실패 시 상태 변화 없음).
class PositionLedger {
public:
    explicit PositionLedger(std::shared_ptr<core::ITradeJournal> journal = nullptr);

    // entry = live_price. SL/TP 는 신호 값 그대로, rebase_levels 면 신호 entry 와의 거리를 유지해 이동
    // Throws InvalidArgumentError (quantity <= 0, invalid price, NEUTRAL signal),
    // JournalWriteError.
    Trade open(const strategy::Signal& signal,
               double quantity,
               double live_price,
               long long now_ms,
               bool rebase_levels = false);

    // OPEN -> CLOSED. pnl = (exit - entry) x qty x sign
    // Throws TradeNotFoundError, TradeAlreadyClosedError, InvalidArgumentError, JournalWriteError.
    Trade close(const std::string& trade_id, CloseReason reason, double exit_price, long long now_ms);

    // 종료 정책별 청산가 결정 후 close 로 위임
    //   MANUAL / MARKET: supplied_price 필수
    //   STOP_LOSS: trade.stop_loss, TAKE_PROFIT: trade.take_profit
    Trade closeWithPolicy(const std::string& trade_id,
                          CloseReason reason,
                          std::optional<double> supplied_price,
                          long long now_ms);

    // 미실현 손익 (OPEN 전용, 저장하지 않음)
    // Throws TradeNotFoundError, TradeAlreadyClosedError.
    double floatingPnl(const std::string& trade_id, double price) const;

    // 해당 심볼의 OPEN 거래 중 SL/TP 에 닿은 것을 청산 (둘 다 닿으면 SL 우선)
    std::vector<Trade> checkExits(const std::string& symbol, double price, long long now_ms);

    // 저널 재생으로 원장 재구성. 반환: 복원된 거래 수
    size_t restore(core::ITradeJournal& journal);

    // Throws TradeNotFoundError.
    Trade getTrade(const std::string& trade_id) const;

    std::vector<Trade> getOpenTrades() const;
    std::vector<Trade> getClosedTrades() const;
    std::vector<Trade> getAllTrades() const;

    // 해당 신호로 만들어진 거래 (OPEN/CLOSED 무관)
    std::optional<Trade> findBySignal(const std::string& signal_id) const;

    // UTC 일(day) 기준 신규 진입 수
    int countOpenedOnUtcDay(long long ts_ms) const;

    static long long utcDay(long long ts_ms) { return ts_ms / 86400000LL; }

private:
    Trade closeLocked(Trade& trade, CloseReason reason, double exit_price, long long now_ms);
    void appendOrThrow(core::TradeEventType type, const Trade& trade, long long ts_ms);

    std::shared_ptr<core::ITradeJournal> journal_;

    mutable std::mutex mutex_;
    std::map<std::string, Trade> trades_;
    std::vector<std::string> order_;        // 생성 순서
};

} // namespace engine
} // namespace signaldesk
