#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "core/contracts/IMarketDataSource.h"

namespace stocktrade {
namespace backtest {

// Reads <dir>/<symbol>.csv (or <symbol>.json) through DataHistory.
class CsvMarketDataSource : public core::IMarketDataSource {
public:
    explicit CsvMarketDataSource(std::filesystem::path data_dir);

    std::vector<PriceBar> loadBars(const std::string& symbol,
                                   TimestampMs start_ms,
                                   TimestampMs end_ms) override;

private:
    std::filesystem::path data_dir_;
};

// Preloaded bars; symbols marked as failing throw DataUnavailableError.
class InMemoryMarketDataSource : public core::IMarketDataSource {
public:
    void setBars(const std::string& symbol, std::vector<PriceBar> bars);
    void failSymbol(const std::string& symbol);

    std::vector<PriceBar> loadBars(const std::string& symbol,
                                   TimestampMs start_ms,
                                   TimestampMs end_ms) override;

private:
    std::map<std::string, std::vector<PriceBar>> bars_;
    std::set<std::string> failing_;
};

} // namespace backtest
} // namespace stocktrade
