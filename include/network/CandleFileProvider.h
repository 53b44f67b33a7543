#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include "network/IMarketDataProvider.h"

namespace signaldesk {
namespace network {

// 디스크의 CSV/JSON 캔들 파일을 시세로 제공 (CLI 재생, 테스트용)
//
// 파일 이름 규칙: <data_dir>/<SYMBOL>_<timeframe>.csv|.json
//   심볼의 '/' 는 '_' 로 바뀐다 (BTC/USD, 1h -> BTC_USD_1h.csv)
// CSV: open_time,open,high,low,close[,volume]  (헤더 줄 허용)
// JSON: [{ "open_time"|"time", "open"|"o", "high"|"h", "low"|"l", "close"|"c", "volume"|"v" }, ...]
class CandleFileProvider : public IMarketDataProvider {
public:
    CandleFileProvider() = default;
    explicit CandleFileProvider(std::filesystem::path data_dir);

    CandleSeries fetchCandles(const std::string& symbol, const std::string& timeframe, int count) override;
    double fetchLastPrice(const std::string& symbol, std::chrono::milliseconds timeout) override;

    // 메모리 시리즈 등록 (파일보다 우선)
    void addSeries(const std::string& symbol, const std::string& timeframe, CandleSeries candles);

    // 재생 커서: 앞에서부터 visible_bars 개만 보이게 한다. 0 이면 전체
    void setCursor(size_t visible_bars);
    size_t cursor() const;

    // 확장자로 형식 판별. Throws PriceUnavailableError if the file cannot be read.
    static CandleSeries loadFile(const std::filesystem::path& file_path);
    static CandleSeries loadCSV(const std::filesystem::path& file_path);
    static CandleSeries loadJSON(const std::filesystem::path& file_path);

    static std::string fileStem(const std::string& symbol, const std::string& timeframe);

private:
    const CandleSeries& seriesLocked(const std::string& symbol, const std::string& timeframe);
    CandleSeries visibleLocked(const CandleSeries& all) const;

    std::filesystem::path data_dir_;
    mutable std::mutex mutex_;
    // key: symbol|timeframe
    std::map<std::string, CandleSeries> series_;
    // 마지막으로 조회된 타임프레임 (fetchLastPrice 기준)
    std::map<std::string, std::string> last_timeframe_;
    size_t cursor_ = 0;
};

} // namespace network
} // namespace signaldesk
