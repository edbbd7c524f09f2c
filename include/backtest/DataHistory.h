#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace stocktrade {
namespace backtest {

class DataHistory {
public:
    // Header: timestamp,open,high,low,close,volume[,indicator columns...]
    // Files without a header are read positionally (first six columns).
    // Empty indicator cells are left out of PriceBar::indicators.
    // Throws DataUnavailableError when the file cannot be opened.
    static std::vector<PriceBar> loadCSV(const std::string& file_path, const std::string& symbol);

    // Array of {timestamp|date, open, high, low, close, volume, ...indicators}
    static std::vector<PriceBar> loadJSON(const std::string& file_path, const std::string& symbol);

    // Inclusive range; 0 leaves a bound open
    static std::vector<PriceBar> filterByTime(const std::vector<PriceBar>& bars,
                                              TimestampMs start_ms,
                                              TimestampMs end_ms);

    // Epoch milliseconds, or "YYYY-MM-DD" (UTC midnight)
    static std::optional<TimestampMs> parseTimestamp(const std::string& value);
};

} // namespace backtest
} // namespace stocktrade
