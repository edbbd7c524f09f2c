#include "backtest/MarketDataSources.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"

#include <algorithm>

namespace stocktrade {
namespace backtest {

CsvMarketDataSource::CsvMarketDataSource(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::vector<PriceBar> CsvMarketDataSource::loadBars(const std::string& symbol,
                                                    TimestampMs start_ms,
                                                    TimestampMs end_ms) {
    const auto csv_path = data_dir_ / (symbol + ".csv");
    const auto json_path = data_dir_ / (symbol + ".json");

    std::vector<PriceBar> bars;
    if (std::filesystem::exists(csv_path)) {
        bars = DataHistory::loadCSV(csv_path.string(), symbol);
    } else if (std::filesystem::exists(json_path)) {
        bars = DataHistory::loadJSON(json_path.string(), symbol);
    } else {
        throw DataUnavailableError("no data file for " + symbol + " in " + data_dir_.string());
    }

    bars = DataHistory::filterByTime(bars, start_ms, end_ms);
    if (bars.empty()) {
        throw DataUnavailableError("no bars for " + symbol + " in requested range");
    }
    return bars;
}

void InMemoryMarketDataSource::setBars(const std::string& symbol, std::vector<PriceBar> bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.timestamp < b.timestamp;
    });
    bars_[symbol] = std::move(bars);
}

void InMemoryMarketDataSource::failSymbol(const std::string& symbol) {
    failing_.insert(symbol);
}

std::vector<PriceBar> InMemoryMarketDataSource::loadBars(const std::string& symbol,
                                                         TimestampMs start_ms,
                                                         TimestampMs end_ms) {
    if (failing_.count(symbol) > 0) {
        throw DataUnavailableError("data source timeout for " + symbol);
    }
    auto it = bars_.find(symbol);
    if (it == bars_.end()) {
        throw DataUnavailableError("unknown symbol " + symbol);
    }
    auto bars = DataHistory::filterByTime(it->second, start_ms, end_ms);
    if (bars.empty()) {
        throw DataUnavailableError("no bars for " + symbol + " in requested range");
    }
    return bars;
}

} // namespace backtest
} // namespace stocktrade
