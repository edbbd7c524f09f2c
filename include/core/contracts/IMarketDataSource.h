#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace stocktrade {
namespace core {

// Market data collaborator. Timeouts and missing symbols surface as
// DataUnavailableError.
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    // Bars for [start_ms, end_ms], chronological. 0 leaves a bound open.
    virtual std::vector<PriceBar> loadBars(const std::string& symbol,
                                           TimestampMs start_ms,
                                           TimestampMs end_ms) = 0;
};

} // namespace core
} // namespace stocktrade
