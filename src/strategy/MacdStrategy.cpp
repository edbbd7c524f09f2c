#include "strategy/MacdStrategy.h"
#include "analytics/IndicatorColumns.h"

namespace stocktrade {
namespace strategy {

namespace col = analytics::columns;

size_t MacdStrategy::minLookback(const StrategyProfile&) const {
    // 26-period slow EMA + 9-period signal EMA, plus one bar for the crossover
    return 26 + 9;
}

std::vector<std::string> MacdStrategy::conditionNames() const {
    return {"macd_crossover_up", "rsi_neutral", "price_above_ema_short", "price_above_ema_long"};
}

WeightedConditionStrategy::ExitCheck MacdStrategy::checkExit(
    const std::vector<PriceBar>& window,
    const StrategyProfile&
) const {
    const PriceBar& cur = latest(window);
    const PriceBar& prev = previous(window);

    const double macd = require(cur, col::kMacdLine);
    const double signal = require(cur, col::kMacdSignal);
    const double prev_macd = require(prev, col::kMacdLine);
    const double prev_signal = require(prev, col::kMacdSignal);
    const double rsi = require(cur, col::kRsi);

    ExitCheck exit;
    if (prev_macd >= prev_signal && macd < signal) {
        exit.triggered = true;
        exit.reason = "MACD bearish crossover";
    } else if (rsi > kOverboughtRsi) {
        exit.triggered = true;
        exit.reason = "RSI overbought";
    }
    return exit;
}

std::map<std::string, bool> MacdStrategy::evaluateConditions(
    const std::vector<PriceBar>& window,
    const StrategyProfile& profile
) const {
    const PriceBar& cur = latest(window);
    const PriceBar& prev = previous(window);

    const double macd = require(cur, col::kMacdLine);
    const double signal = require(cur, col::kMacdSignal);
    const double prev_macd = require(prev, col::kMacdLine);
    const double prev_signal = require(prev, col::kMacdSignal);
    const double rsi = require(cur, col::kRsi);
    const double ema_short = require(cur, col::kEmaShort);
    const double sma_long = require(cur, col::kSmaSlow);

    std::map<std::string, bool> conditions;
    conditions["macd_crossover_up"] = (prev_macd <= prev_signal) && (macd > signal);
    conditions["rsi_neutral"] = (rsi >= profile.rsi_low) && (rsi <= profile.rsi_high);
    conditions["price_above_ema_short"] = cur.close > ema_short;
    conditions["price_above_ema_long"] = cur.close > sma_long;
    return conditions;
}

} // namespace strategy
} // namespace stocktrade
