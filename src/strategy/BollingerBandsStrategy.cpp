#include "strategy/BollingerBandsStrategy.h"
#include "analytics/IndicatorColumns.h"

namespace stocktrade {
namespace strategy {

namespace col = analytics::columns;

size_t BollingerBandsStrategy::minLookback(const StrategyProfile&) const {
    return 21;
}

std::vector<std::string> BollingerBandsStrategy::conditionNames() const {
    return {"lower_band_rebound", "near_lower_band", "rsi_not_overbought", "volume_confirmation"};
}

WeightedConditionStrategy::ExitCheck BollingerBandsStrategy::checkExit(
    const std::vector<PriceBar>& window,
    const StrategyProfile& profile
) const {
    const PriceBar& cur = latest(window);
    const double upper = require(cur, col::kBollingerUpper);
    const double rsi = require(cur, col::kRsi);

    ExitCheck exit;
    if (cur.close >= upper * kUpperBandTolerance) {
        exit.triggered = true;
        exit.reason = "price at upper band";
    } else if (rsi > profile.rsi_high) {
        exit.triggered = true;
        exit.reason = "RSI overbought";
    }
    return exit;
}

std::map<std::string, bool> BollingerBandsStrategy::evaluateConditions(
    const std::vector<PriceBar>& window,
    const StrategyProfile& profile
) const {
    const PriceBar& cur = latest(window);
    const PriceBar& prev = previous(window);
    const double lower = require(cur, col::kBollingerLower);
    const double middle = require(cur, col::kBollingerMiddle);
    const double prev_lower = require(prev, col::kBollingerLower);
    const double rsi = require(cur, col::kRsi);

    std::map<std::string, bool> conditions;
    conditions["lower_band_rebound"] = (prev.close <= prev_lower) && (cur.close > lower);
    conditions["near_lower_band"] = (cur.close <= lower * kLowerBandTolerance) && (cur.close < middle);
    conditions["rsi_not_overbought"] = rsi < profile.rsi_high;
    conditions["volume_confirmation"] = volumeConfirmed(window);
    return conditions;
}

} // namespace strategy
} // namespace stocktrade
