#pragma once

#include "strategy/WeightedConditionStrategy.h"

namespace stocktrade {
namespace strategy {

// Mean reversion off the lower Bollinger band (20, 2.0).
class BollingerBandsStrategy : public WeightedConditionStrategy {
public:
    static constexpr double kLowerBandTolerance = 1.01;
    static constexpr double kUpperBandTolerance = 0.99;

    StrategyKind kind() const override { return StrategyKind::BOLLINGER_BANDS; }
    size_t minLookback(const StrategyProfile& profile) const override;
    std::vector<std::string> conditionNames() const override;
    std::string crossoverCondition() const override { return "lower_band_rebound"; }

protected:
    ExitCheck checkExit(const std::vector<PriceBar>& window,
                        const StrategyProfile& profile) const override;
    std::map<std::string, bool> evaluateConditions(
        const std::vector<PriceBar>& window,
        const StrategyProfile& profile) const override;
};

} // namespace strategy
} // namespace stocktrade
