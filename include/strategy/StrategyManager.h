#pragma once

#include "strategy/IStrategy.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stocktrade {
namespace strategy {

// Only factory for the closed set of strategy variants.
std::unique_ptr<IStrategy> makeStrategy(StrategyKind kind);

// Binds one strategy variant to one profile for the duration of a run.
class StrategyManager {
public:
    StrategyManager(StrategyKind kind, StrategyProfile profile);

    // Data problems (short window, missing indicator) are reported as
    // "no signal" and logged at debug level.
    std::optional<Signal> evaluate(const std::string& symbol,
                                   const std::vector<PriceBar>& window) const;

    const IStrategy& strategy() const { return *strategy_; }
    const StrategyProfile& profile() const { return profile_; }
    size_t minLookback() const { return strategy_->minLookback(profile_); }

private:
    std::unique_ptr<IStrategy> strategy_;
    StrategyProfile profile_;
};

} // namespace strategy
} // namespace stocktrade
