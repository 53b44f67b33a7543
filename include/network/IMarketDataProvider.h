#pragma once

#include <chrono>
#include <string>
#include "common/Types.h"

namespace signaldesk {
namespace network {

// 시세 수집 경계. 실제 거래소/브로커 연동은 이 인터페이스 바깥에 구현
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    // 최근 count 개 캔들 (open_time 오름차순)
    // Throws PriceUnavailableError when the series cannot be served.
    virtual CandleSeries fetchCandles(
        const std::string& symbol,
        const std::string& timeframe,
        int count
    ) = 0;

    // 구현체는 timeout 안에 반환하거나 PriceUnavailableError 를 던져야 한다
    virtual double fetchLastPrice(
        const std::string& symbol,
        std::chrono::milliseconds timeout
    ) = 0;
};

} // namespace network
} // namespace signaldesk
