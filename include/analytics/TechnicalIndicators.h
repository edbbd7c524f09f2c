#pragma once

#include <optional>
#include <vector>
#include "common/Types.h"

namespace stocktrade {
namespace analytics {

// One value per input element; std::nullopt while the indicator warms up.
using Series = std::vector<std::optional<double>>;

class TechnicalIndicators {
public:
    // RSI with Wilder smoothing
    static Series rsiSeries(const std::vector<double>& prices, int period = 14);

    // EMA seeded with the SMA of the first `period` values
    static Series emaSeries(const std::vector<double>& prices, int period);
    static Series smaSeries(const std::vector<double>& prices, int period);

    struct MACDSeries {
        Series line;
        Series signal;
    };
    static MACDSeries macdSeries(const std::vector<double>& prices,
                                 int fast = 12, int slow = 26, int signal_period = 9);

    struct BollingerSeries {
        Series upper;
        Series middle;
        Series lower;
    };
    // Population standard deviation over the window
    static BollingerSeries bollingerSeries(const std::vector<double>& prices,
                                           int period = 20, double std_dev_mult = 2.0);

    // ATR with Wilder smoothing, first value at index `period`
    static Series atrSeries(const std::vector<PriceBar>& bars, int period = 14);

    static std::vector<double> extractClosePrices(const std::vector<PriceBar>& bars);
};

} // namespace analytics
} // namespace stocktrade
