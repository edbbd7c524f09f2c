#pragma once

#include "strategy/StrategyConfig.h"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace stocktrade {
namespace strategy {

// strategy -> profile -> parameters. Loaded once per run, read-only afterwards.
class StrategyCatalog {
public:
    // conservative / balanced / aggressive for every strategy, plus canonical for MACD
    static StrategyCatalog builtin();

    // Merge {"macd": {"balanced": {...}}, ...} over the current entries.
    // Throws ConfigError on unknown strategy ids, unknown weight keys,
    // wrong value types or out-of-range values.
    void applyOverrides(const nlohmann::json& strategies);

    // Throws ConfigError when the profile is not defined for the strategy.
    const StrategyProfile& profile(StrategyKind kind, const std::string& name) const;
    bool hasProfile(StrategyKind kind, const std::string& name) const;
    std::vector<std::string> profileNames(StrategyKind kind) const;

    void put(StrategyKind kind, const StrategyProfile& profile);

    static void validate(StrategyKind kind, const StrategyProfile& profile);

private:
    std::map<StrategyKind, std::map<std::string, StrategyProfile>> profiles_;
};

} // namespace strategy
} // namespace stocktrade
