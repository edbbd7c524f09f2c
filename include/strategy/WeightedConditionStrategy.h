#pragma once

#include "strategy/IStrategy.h"
#include <map>
#include <string>
#include <vector>

namespace stocktrade {
namespace strategy {

// Common scoring for strategies whose entry rule is a weighted sum of
// boolean sub-conditions compared with the profile's entry_threshold.
class WeightedConditionStrategy : public IStrategy {
public:
    static constexpr double kScoreEpsilon = 1e-9;
    static constexpr double kVolumeMultiplier = 1.2;
    static constexpr size_t kVolumeLookback = 10;

    std::optional<Signal> generateSignal(
        const std::string& symbol,
        const std::vector<PriceBar>& window,
        const StrategyProfile& profile
    ) const override;

protected:
    struct ExitCheck {
        bool triggered = false;
        std::string reason;
    };

    virtual ExitCheck checkExit(const std::vector<PriceBar>& window,
                                const StrategyProfile& profile) const = 0;

    virtual std::map<std::string, bool> evaluateConditions(
        const std::vector<PriceBar>& window,
        const StrategyProfile& profile) const = 0;

    // Throws MissingIndicatorError when the column is absent.
    static double require(const PriceBar& bar, const char* column);

    // Latest volume above kVolumeMultiplier x mean of the preceding bars.
    static bool volumeConfirmed(const std::vector<PriceBar>& window);

    static const PriceBar& latest(const std::vector<PriceBar>& window) { return window.back(); }
    static const PriceBar& previous(const std::vector<PriceBar>& window) { return window[window.size() - 2]; }
};

} // namespace strategy
} // namespace stocktrade
