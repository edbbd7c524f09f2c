#pragma once

#include "common/Types.h"
#include "strategy/StrategyConfig.h"
#include <optional>
#include <string>
#include <vector>

namespace stocktrade {
namespace strategy {

enum class SignalDirection {
    ENTER_LONG,
    EXIT_LONG
};

// Produced fresh each cycle, never persisted.
struct Signal {
    std::string symbol;
    SignalDirection direction;
    std::string strategy_id;
    std::string profile_id;
    double confidence;          // 0.0 ~ 1.0
    double score;               // weighted condition sum
    double price;               // close of the bar that produced the signal
    TimestampMs generated_at;
    std::string reason;

    Signal()
        : direction(SignalDirection::ENTER_LONG)
        , confidence(0.0)
        , score(0.0)
        , price(0.0)
        , generated_at(0)
    {}

    bool isEntry() const { return direction == SignalDirection::ENTER_LONG; }
};

const char* toString(SignalDirection direction);

// Strategy interface. Implementations are stateless: the same window and
// profile always produce the same signal.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyKind kind() const = 0;
    std::string id() const { return toString(kind()); }

    // Minimum number of bars the window must hold.
    virtual size_t minLookback(const StrategyProfile& profile) const = 0;

    // Condition names accepted as entry_weights keys.
    virtual std::vector<std::string> conditionNames() const = 0;

    // The condition that must be strictly true when the score ties the threshold.
    virtual std::string crossoverCondition() const = 0;

    // window: chronological bars, latest last. Throws InsufficientDataError
    // when the window is shorter than minLookback(), MissingIndicatorError
    // when a required column is absent on the latest bars.
    virtual std::optional<Signal> generateSignal(
        const std::string& symbol,
        const std::vector<PriceBar>& window,
        const StrategyProfile& profile
    ) const = 0;
};

} // namespace strategy
} // namespace stocktrade
