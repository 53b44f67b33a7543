#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "network/IMarketDataProvider.h"

namespace signaldesk {
namespace network {

struct PriceQuote {
    double price = 0.0;
    long long ts_ms = 0;        // 가격을 받은 시각
    bool from_cache = false;    // 조회 실패 후 마지막 가격으로 대체됨
};

// 실시간 가격 조회 + 마지막 가격 캐시
//
// 1) provider 에 timeout 을 걸어 조회
// 2) 실패(PriceUnavailableError) 시 freshness 창 안의 마지막 가격으로 대체
// 3) 그것도 없으면 PriceUnavailableError 전달
class LivePriceService {
public:
    using Clock = std::function<long long()>;

    LivePriceService(std::shared_ptr<IMarketDataProvider> provider,
                     int timeout_ms,
                     int freshness_ms,
                     Clock clock = currentTimestampMs);

    // Throws PriceUnavailableError.
    PriceQuote getQuote(const std::string& symbol);
    double getPrice(const std::string& symbol) { return getQuote(symbol).price; }

    // 외부 피드가 밀어주는 가격 (캐시만 갱신)
    void recordPrice(const std::string& symbol, double price);

    std::optional<PriceQuote> lastKnown(const std::string& symbol) const;

    // 미실현 손익 계산용 최근 가격 스냅샷
    std::map<std::string, double> lastPrices() const;

    void setLimits(int timeout_ms, int freshness_ms);

private:
    std::shared_ptr<IMarketDataProvider> provider_;
    Clock clock_;

    mutable std::mutex mutex_;
    int timeout_ms_;
    int freshness_ms_;
    std::map<std::string, PriceQuote> cache_;
};

} // namespace network
} // namespace signaldesk
