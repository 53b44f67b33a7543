#include "network/LivePriceService.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <cmath>

namespace signaldesk {
namespace network {

LivePriceService::LivePriceService(std::shared_ptr<IMarketDataProvider> provider,
                                   int timeout_ms,
                                   int freshness_ms,
                                   Clock clock)
    : provider_(std::move(provider))
    , clock_(std::move(clock))
    , timeout_ms_(timeout_ms)
    , freshness_ms_(freshness_ms)
{
    if (!provider_) {
        throw InvalidArgumentError("LivePriceService requires a market data provider");
    }
}

PriceQuote LivePriceService::getQuote(const std::string& symbol) {
    int timeout_ms = 0;
    int freshness_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timeout_ms = timeout_ms_;
        freshness_ms = freshness_ms_;
    }

    // provider 호출은 잠금 밖에서 (느린 조회가 다른 심볼을 막지 않도록)
    std::string failure;
    try {
        const double price = provider_->fetchLastPrice(symbol, std::chrono::milliseconds(timeout_ms));
        if (std::isfinite(price) && price > 0.0) {
            PriceQuote quote;
            quote.price = price;
            quote.ts_ms = clock_();
            std::lock_guard<std::mutex> lock(mutex_);
            cache_[symbol] = quote;
            return quote;
        }
        failure = "provider returned invalid price";
    } catch (const PriceUnavailableError& e) {
        failure = e.what();
    }

    const long long now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(symbol);
    if (it != cache_.end() && now - it->second.ts_ms <= freshness_ms) {
        PriceQuote quote = it->second;
        quote.from_cache = true;
        LOG_WARN("{} price lookup failed ({}), using last known {} ({} ms old)",
                 symbol, failure, quote.price, now - quote.ts_ms);
        return quote;
    }

    LOG_ERROR("{} price unavailable: {}", symbol, failure);
    throw PriceUnavailableError("price unavailable for " + symbol + ": " + failure);
}

void LivePriceService::recordPrice(const std::string& symbol, double price) {
    if (!std::isfinite(price) || price <= 0.0) {
        throw InvalidArgumentError("invalid price for " + symbol);
    }
    PriceQuote quote;
    quote.price = price;
    quote.ts_ms = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[symbol] = quote;
}

std::optional<PriceQuote> LivePriceService::lastKnown(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(symbol);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, double> LivePriceService::lastPrices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, double> out;
    for (const auto& [symbol, quote] : cache_) {
        out[symbol] = quote.price;
    }
    return out;
}

void LivePriceService::setLimits(int timeout_ms, int freshness_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_ms_ = timeout_ms;
    freshness_ms_ = freshness_ms;
}

} // namespace network
} // namespace signaldesk
