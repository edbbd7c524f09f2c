#pragma once

#include <map>
#include <optional>
#include <string>

namespace stocktrade {
namespace strategy {

enum class StrategyKind {
    MACD,
    RSI,
    MOVING_AVERAGE,
    BOLLINGER_BANDS
};

// Named parameter set applied to one strategy family.
// Percentages are fractions (0.05 == 5%).
struct StrategyProfile {
    std::string name;
    std::map<std::string, double> entry_weights;
    double entry_threshold = 0.3;
    double rsi_low = 40.0;
    double rsi_high = 60.0;
    double stop_loss_pct = 0.03;
    double take_profit_pct = 0.05;
    int max_hold_days = 30;

    double totalWeight() const {
        double total = 0.0;
        for (const auto& [name, weight] : entry_weights) {
            total += weight;
        }
        return total;
    }

    double weight(const std::string& condition) const {
        auto it = entry_weights.find(condition);
        return (it != entry_weights.end()) ? it->second : 0.0;
    }
};

const char* toString(StrategyKind kind);

// Accepts the canonical ids ("macd", "rsi", "ma_crossover", "bollinger_bands")
// plus a few aliases, case-insensitive.
std::optional<StrategyKind> strategyKindFromString(const std::string& id);

} // namespace strategy
} // namespace stocktrade
