#include "strategy/WeightedConditionStrategy.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace stocktrade {
namespace strategy {

const char* toString(SignalDirection direction) {
    return (direction == SignalDirection::ENTER_LONG) ? "enter_long" : "exit_long";
}

std::optional<Signal> WeightedConditionStrategy::generateSignal(
    const std::string& symbol,
    const std::vector<PriceBar>& window,
    const StrategyProfile& profile
) const {
    const size_t need = minLookback(profile);
    if (window.size() < need || window.size() < 2) {
        throw InsufficientDataError(symbol, window.size(), std::max<size_t>(need, 2));
    }

    const PriceBar& bar = latest(window);

    Signal signal;
    signal.symbol = symbol;
    signal.strategy_id = id();
    signal.profile_id = profile.name;
    signal.price = bar.close;
    signal.generated_at = bar.timestamp;

    // Exit rules take precedence over entry scoring.
    const ExitCheck exit = checkExit(window, profile);
    if (exit.triggered) {
        signal.direction = SignalDirection::EXIT_LONG;
        signal.confidence = 1.0;
        signal.score = 1.0;
        signal.reason = exit.reason;
        return signal;
    }

    const auto conditions = evaluateConditions(window, profile);

    double score = 0.0;
    std::ostringstream matched;
    for (const auto& [name, weight] : profile.entry_weights) {
        auto it = conditions.find(name);
        if (it == conditions.end() || !it->second) {
            continue;
        }
        score += weight;
        if (matched.tellp() > 0) {
            matched << ",";
        }
        matched << name;
    }

    auto crossover_it = conditions.find(crossoverCondition());
    const bool crossover = (crossover_it != conditions.end()) && crossover_it->second;

    const double threshold = profile.entry_threshold;
    const bool above = score > threshold + kScoreEpsilon;
    const bool tie = std::abs(score - threshold) <= kScoreEpsilon;
    if (!above && !(tie && crossover)) {
        return std::nullopt;
    }

    const double total = profile.totalWeight();
    signal.direction = SignalDirection::ENTER_LONG;
    signal.score = score;
    signal.confidence = (total > 0.0) ? std::clamp(score / total, 0.0, 1.0) : 0.0;

    std::ostringstream reason;
    reason << "score " << score << " vs threshold " << threshold << " [" << matched.str() << "]";
    signal.reason = reason.str();
    return signal;
}

double WeightedConditionStrategy::require(const PriceBar& bar, const char* column) {
    auto value = bar.indicator(column);
    if (!value || !std::isfinite(*value)) {
        throw MissingIndicatorError(bar.symbol, column);
    }
    return *value;
}

bool WeightedConditionStrategy::volumeConfirmed(const std::vector<PriceBar>& window) {
    if (window.size() < kVolumeLookback + 1) {
        return false;
    }
    double sum = 0.0;
    for (size_t i = window.size() - 1 - kVolumeLookback; i < window.size() - 1; ++i) {
        sum += window[i].volume;
    }
    const double average = sum / static_cast<double>(kVolumeLookback);
    return average > 0.0 && window.back().volume > average * kVolumeMultiplier;
}

} // namespace strategy
} // namespace stocktrade
