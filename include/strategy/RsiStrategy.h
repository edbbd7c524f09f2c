#pragma once

#include "strategy/WeightedConditionStrategy.h"

namespace stocktrade {
namespace strategy {

// Oversold rebound. The profile's rsi_range is read as (oversold, overbought).
class RsiStrategy : public WeightedConditionStrategy {
public:
    static constexpr size_t kDivergenceLookback = 10;

    StrategyKind kind() const override { return StrategyKind::RSI; }
    size_t minLookback(const StrategyProfile& profile) const override;
    std::vector<std::string> conditionNames() const override;
    std::string crossoverCondition() const override { return "rsi_cross_up"; }

protected:
    ExitCheck checkExit(const std::vector<PriceBar>& window,
                        const StrategyProfile& profile) const override;
    std::map<std::string, bool> evaluateConditions(
        const std::vector<PriceBar>& window,
        const StrategyProfile& profile) const override;

private:
    static bool bearishDivergence(const std::vector<PriceBar>& window);
};

} // namespace strategy
} // namespace stocktrade
