#include "strategy/MovingAverageStrategy.h"
#include "analytics/IndicatorColumns.h"

namespace stocktrade {
namespace strategy {

namespace col = analytics::columns;

size_t MovingAverageStrategy::minLookback(const StrategyProfile&) const {
    return 21;
}

std::vector<std::string> MovingAverageStrategy::conditionNames() const {
    return {"ma_crossover_up", "price_above_mas", "rsi_not_overbought", "volume_confirmation"};
}

WeightedConditionStrategy::ExitCheck MovingAverageStrategy::checkExit(
    const std::vector<PriceBar>& window,
    const StrategyProfile& profile
) const {
    const PriceBar& cur = latest(window);
    const PriceBar& prev = previous(window);
    const double fast = require(cur, col::kSmaFast);
    const double slow = require(cur, col::kSmaSlow);
    const double prev_fast = require(prev, col::kSmaFast);
    const double prev_slow = require(prev, col::kSmaSlow);
    const double rsi = require(cur, col::kRsi);

    ExitCheck exit;
    if (prev_fast >= prev_slow && fast < slow) {
        exit.triggered = true;
        exit.reason = "MA bearish crossover";
    } else if (cur.close < fast && cur.close < slow) {
        exit.triggered = true;
        exit.reason = "price below both moving averages";
    } else if (rsi > profile.rsi_high) {
        exit.triggered = true;
        exit.reason = "RSI overbought";
    }
    return exit;
}

std::map<std::string, bool> MovingAverageStrategy::evaluateConditions(
    const std::vector<PriceBar>& window,
    const StrategyProfile& profile
) const {
    const PriceBar& cur = latest(window);
    const PriceBar& prev = previous(window);
    const double fast = require(cur, col::kSmaFast);
    const double slow = require(cur, col::kSmaSlow);
    const double prev_fast = require(prev, col::kSmaFast);
    const double prev_slow = require(prev, col::kSmaSlow);
    const double rsi = require(cur, col::kRsi);

    std::map<std::string, bool> conditions;
    conditions["ma_crossover_up"] = (prev_fast <= prev_slow) && (fast > slow);
    conditions["price_above_mas"] = (cur.close > fast) && (cur.close > slow);
    conditions["rsi_not_overbought"] = rsi < profile.rsi_high;
    conditions["volume_confirmation"] = volumeConfirmed(window);
    return conditions;
}

} // namespace strategy
} // namespace stocktrade
