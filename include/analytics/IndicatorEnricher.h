#pragma once

#include "common/Types.h"
#include <vector>

namespace stocktrade {
namespace analytics {

// Fills standard indicator columns the feed did not provide, computed from
// OHLCV. Existing columns are left untouched.
class IndicatorEnricher {
public:
    // bars: one symbol, chronological
    static void enrich(std::vector<PriceBar>& bars);
};

} // namespace analytics
} // namespace stocktrade
