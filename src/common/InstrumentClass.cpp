#include "common/InstrumentClass.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace signaldesk {
namespace common {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

const std::array<const char*, 4> kMetals = {"XAU", "XAG", "XPT", "XPD"};
const std::array<const char*, 5> kCmeFutures = {"ES", "NQ", "CL", "GC", "SI"};
const std::array<const char*, 7> kIndices = {"US30", "US100", "US500", "GER40", "UK100", "FRA40", "JPN225"};
const std::array<const char*, 8> kFiat = {"USD", "EUR", "GBP", "JPY", "CHF", "AUD", "CAD", "NZD"};

bool isFiat(const std::string& code) {
    return std::find(kFiat.begin(), kFiat.end(), code) != kFiat.end();
}
}

bool parseInstrumentClass(const std::string& market_type, InstrumentClass& out) {
    const std::string v = toLowerCopy(market_type);
    if (v == "crypto") { out = InstrumentClass::CRYPTO; return true; }
    if (v == "forex" || v == "fx") { out = InstrumentClass::FOREX; return true; }
    if (v == "indices" || v == "index") { out = InstrumentClass::INDICES; return true; }
    if (v == "metals" || v == "metal") { out = InstrumentClass::METALS; return true; }
    if (v == "futures" || v == "cme") { out = InstrumentClass::FUTURES; return true; }
    if (v == "stocks" || v == "stock" || v == "equities") { out = InstrumentClass::STOCKS; return true; }
    return false;
}

InstrumentClass inferInstrumentClass(const std::string& symbol) {
    const std::string s = toUpperCopy(symbol);

    const auto slash = s.find('/');
    const std::string base = (slash == std::string::npos) ? s : s.substr(0, slash);
    const std::string quote = (slash == std::string::npos) ? std::string() : s.substr(slash + 1);

    if (std::find(kMetals.begin(), kMetals.end(), base) != kMetals.end()) {
        return InstrumentClass::METALS;
    }
    if (slash == std::string::npos) {
        if (std::find(kCmeFutures.begin(), kCmeFutures.end(), s) != kCmeFutures.end()) {
            return InstrumentClass::FUTURES;
        }
        if (std::find(kIndices.begin(), kIndices.end(), s) != kIndices.end()) {
            return InstrumentClass::INDICES;
        }
        return InstrumentClass::STOCKS;
    }
    if (isFiat(base) && isFiat(quote)) {
        return InstrumentClass::FOREX;
    }
    return InstrumentClass::CRYPTO;
}

InstrumentClass resolveInstrumentClass(const std::string& market_type, const std::string& symbol) {
    InstrumentClass parsed = InstrumentClass::CRYPTO;
    if (!market_type.empty() && parseInstrumentClass(market_type, parsed)) {
        return parsed;
    }
    return inferInstrumentClass(symbol);
}

} // namespace common
} // namespace signaldesk
