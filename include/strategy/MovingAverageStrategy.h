#pragma once

#include "strategy/WeightedConditionStrategy.h"

namespace stocktrade {
namespace strategy {

// Fast SMA (10) crossing the slow SMA (20).
class MovingAverageStrategy : public WeightedConditionStrategy {
public:
    StrategyKind kind() const override { return StrategyKind::MOVING_AVERAGE; }
    size_t minLookback(const StrategyProfile& profile) const override;
    std::vector<std::string> conditionNames() const override;
    std::string crossoverCondition() const override { return "ma_crossover_up"; }

protected:
    ExitCheck checkExit(const std::vector<PriceBar>& window,
                        const StrategyProfile& profile) const override;
    std::map<std::string, bool> evaluateConditions(
        const std::vector<PriceBar>& window,
        const StrategyProfile& profile) const override;
};

} // namespace strategy
} // namespace stocktrade
