#include "network/CandleFileProvider.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace signaldesk {
namespace network {

namespace {
std::string seriesKey(const std::string& symbol, const std::string& timeframe) {
    return symbol + "|" + timeframe;
}

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}
}

CandleFileProvider::CandleFileProvider(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {
}

CandleSeries CandleFileProvider::fetchCandles(const std::string& symbol, const std::string& timeframe, int count) {
    if (count <= 0) {
        throw InvalidArgumentError("candle count must be > 0");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto visible = visibleLocked(seriesLocked(symbol, timeframe));
    last_timeframe_[symbol] = timeframe;

    const size_t n = std::min(visible.size(), static_cast<size_t>(count));
    return CandleSeries(visible.end() - static_cast<std::ptrdiff_t>(n), visible.end());
}

double CandleFileProvider::fetchLastPrice(const std::string& symbol, std::chrono::milliseconds /*timeout*/) {
    std::lock_guard<std::mutex> lock(mutex_);

    const CandleSeries* series = nullptr;
    auto tf = last_timeframe_.find(symbol);
    if (tf != last_timeframe_.end()) {
        series = &seriesLocked(symbol, tf->second);
    } else {
        const std::string prefix = symbol + "|";
        for (const auto& [key, candles] : series_) {
            if (key.compare(0, prefix.size(), prefix) == 0) {
                series = &candles;
                break;
            }
        }
    }

    if (series == nullptr) {
        throw PriceUnavailableError("no price source for " + symbol);
    }

    const auto visible = visibleLocked(*series);
    if (visible.empty()) {
        throw PriceUnavailableError("no candles for " + symbol);
    }
    return visible.back().close;
}

void CandleFileProvider::addSeries(const std::string& symbol, const std::string& timeframe, CandleSeries candles) {
    std::lock_guard<std::mutex> lock(mutex_);
    series_[seriesKey(symbol, timeframe)] = std::move(candles);
}

void CandleFileProvider::setCursor(size_t visible_bars) {
    std::lock_guard<std::mutex> lock(mutex_);
    cursor_ = visible_bars;
}

size_t CandleFileProvider::cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

const CandleSeries& CandleFileProvider::seriesLocked(const std::string& symbol, const std::string& timeframe) {
    const std::string key = seriesKey(symbol, timeframe);
    auto it = series_.find(key);
    if (it != series_.end()) {
        return it->second;
    }

    if (data_dir_.empty()) {
        throw PriceUnavailableError("no candle series registered for " + symbol + " " + timeframe);
    }

    const std::string stem = fileStem(symbol, timeframe);
    for (const char* ext : {".csv", ".json"}) {
        const auto path = data_dir_ / (stem + ext);
        if (std::filesystem::exists(path)) {
            auto inserted = series_.emplace(key, loadFile(path));
            return inserted.first->second;
        }
    }

    throw PriceUnavailableError("candle file not found for " + symbol + " " + timeframe +
                                " in " + data_dir_.string());
}

CandleSeries CandleFileProvider::visibleLocked(const CandleSeries& all) const {
    if (cursor_ == 0 || cursor_ >= all.size()) {
        return all;
    }
    return CandleSeries(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(cursor_));
}

CandleSeries CandleFileProvider::loadFile(const std::filesystem::path& file_path) {
    std::string ext = file_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

CandleSeries CandleFileProvider::loadCSV(const std::filesystem::path& file_path) {
    CandleSeries candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw PriceUnavailableError("failed to open CSV file: " + file_path.string());
    }

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 5) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            Candle candle;
            candle.open_time = std::stoll(row[0]);
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = row.size() > 5 ? std::stod(row[5]) : 0.0;
            candles.push_back(candle);
        } catch (const std::logic_error& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.open_time < b.open_time;
    });

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path.string());
    return candles;
}

CandleSeries CandleFileProvider::loadJSON(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw PriceUnavailableError("failed to open JSON file: " + file_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw PriceUnavailableError("malformed candle JSON " + file_path.string() + ": " + e.what());
    }

    // { "candles": [...] } 형태도 허용
    if (j.is_object() && j.contains("candles")) {
        j = j["candles"];
    }

    auto candles = analytics::TechnicalIndicators::jsonToCandles(j);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path.string());
    return candles;
}

std::string CandleFileProvider::fileStem(const std::string& symbol, const std::string& timeframe) {
    std::string stem = symbol;
    std::replace(stem.begin(), stem.end(), '/', '_');
    return stem + "_" + timeframe;
}

} // namespace network
} // namespace signaldesk
