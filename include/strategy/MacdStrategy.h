#pragma once

#include "strategy/WeightedConditionStrategy.h"

namespace stocktrade {
namespace strategy {

// MACD line/signal crossover with RSI neutrality and EMA trend confirmation.
class MacdStrategy : public WeightedConditionStrategy {
public:
    static constexpr double kOverboughtRsi = 70.0;

    StrategyKind kind() const override { return StrategyKind::MACD; }
    size_t minLookback(const StrategyProfile& profile) const override;
    std::vector<std::string> conditionNames() const override;
    std::string crossoverCondition() const override { return "macd_crossover_up"; }

protected:
    ExitCheck checkExit(const std::vector<PriceBar>& window,
                        const StrategyProfile& profile) const override;
    std::map<std::string, bool> evaluateConditions(
        const std::vector<PriceBar>& window,
        const StrategyProfile& profile) const override;
};

} // namespace strategy
} // namespace stocktrade
