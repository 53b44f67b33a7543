#pragma once
// ===================================================================
// 시장 분류별 가격 정밀도 (Instrument Class)
//
// 신호 생성 시점에 한 번 결정되어 Signal/Trade 에 실려 다닌다.
// 가격 반올림과 표시 형식은 모두 여기서 처리한다.
//
// | 분류     | 소수 자릿수                         |
// |----------|-------------------------------------|
// | CRYPTO   | >=1000: 2, >=1: 4, 그 외: 유효숫자 6   |
// | FOREX    | 5 (JPY 크로스: 3)                    |
// | INDICES  | 2                                   |
// | METALS   | 2                                   |
// | FUTURES  | 2                                   |
// | STOCKS   | 2                                   |
// ===================================================================

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace signaldesk {
namespace common {

enum class InstrumentClass { CRYPTO, FOREX, INDICES, METALS, FUTURES, STOCKS };

struct InstrumentSpec {
    InstrumentClass instrument;
    const char* name;
};

inline InstrumentSpec getInstrumentSpec(InstrumentClass instrument) {
    switch (instrument) {
        case InstrumentClass::CRYPTO:  return {instrument, "crypto"};
        case InstrumentClass::FOREX:   return {instrument, "forex"};
        case InstrumentClass::INDICES: return {instrument, "indices"};
        case InstrumentClass::METALS:  return {instrument, "metals"};
        case InstrumentClass::FUTURES: return {instrument, "futures"};
        case InstrumentClass::STOCKS:  return {instrument, "stocks"};
    }
    return {InstrumentClass::CRYPTO, "crypto"};
}

inline std::string toString(InstrumentClass instrument) {
    return getInstrumentSpec(instrument).name;
}

inline bool isJpyCross(const std::string& symbol) {
    return symbol.find("JPY") != std::string::npos;
}

constexpr int kMaxCryptoDecimals = 15;

inline int priceDecimals(InstrumentClass instrument, double price, const std::string& symbol = "") {
    switch (instrument) {
        case InstrumentClass::CRYPTO: {
            const double p = std::fabs(price);
            if (p >= 1000.0) return 2;
            if (p >= 1.0) return 4;
            if (!(p > 0.0) || !std::isfinite(p)) return 6;
            // 1 미만 코인은 유효숫자 6자리 (0.5 -> 6, 0.00001234 -> 10)
            const int magnitude = static_cast<int>(std::floor(std::log10(p)));
            return std::min(kMaxCryptoDecimals, std::max(6, 5 - magnitude));
        }
        case InstrumentClass::FOREX:
            return isJpyCross(symbol) ? 3 : 5;
        case InstrumentClass::INDICES:
        case InstrumentClass::METALS:
        case InstrumentClass::FUTURES:
        case InstrumentClass::STOCKS:
            return 2;
    }
    return 2;
}

// 분류별 정밀도로 반올림
inline double roundPrice(InstrumentClass instrument, double price, const std::string& symbol = "") {
    const int decimals = priceDecimals(instrument, price, symbol);
    const double factor = std::pow(10.0, decimals);
    return std::round(price * factor) / factor;
}

// 표시용 가격 문자열
inline std::string formatPrice(InstrumentClass instrument, double price, const std::string& symbol = "") {
    const int decimals = priceDecimals(instrument, price, symbol);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, price);
    return std::string(buf);
}

// "crypto" / "forex" / ... -> InstrumentClass. 알 수 없는 값이면 false
bool parseInstrumentClass(const std::string& market_type, InstrumentClass& out);

// 심볼만으로 분류 추정 (XAU/USD -> METALS, EUR/USD -> FOREX, ES -> FUTURES ...)
InstrumentClass inferInstrumentClass(const std::string& symbol);

// market_type 이 비었거나 알 수 없으면 심볼로 추정
InstrumentClass resolveInstrumentClass(const std::string& market_type, const std::string& symbol);

} // namespace common
} // namespace signaldesk
