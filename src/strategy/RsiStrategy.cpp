#include "strategy/RsiStrategy.h"
#include "analytics/IndicatorColumns.h"

namespace stocktrade {
namespace strategy {

namespace col = analytics::columns;

size_t RsiStrategy::minLookback(const StrategyProfile&) const {
    // sma_20 trend filter plus one bar for the RSI cross
    return 21;
}

std::vector<std::string> RsiStrategy::conditionNames() const {
    return {"rsi_cross_up", "rsi_oversold", "volume_confirmation", "trend_filter"};
}

WeightedConditionStrategy::ExitCheck RsiStrategy::checkExit(
    const std::vector<PriceBar>& window,
    const StrategyProfile& profile
) const {
    const double rsi = require(latest(window), col::kRsi);

    ExitCheck exit;
    if (rsi >= profile.rsi_high) {
        exit.triggered = true;
        exit.reason = "RSI overbought";
    } else if (bearishDivergence(window)) {
        exit.triggered = true;
        exit.reason = "RSI bearish divergence";
    }
    return exit;
}

std::map<std::string, bool> RsiStrategy::evaluateConditions(
    const std::vector<PriceBar>& window,
    const StrategyProfile& profile
) const {
    const PriceBar& cur = latest(window);
    const double rsi = require(cur, col::kRsi);
    const double prev_rsi = require(previous(window), col::kRsi);
    const double sma_slow = require(cur, col::kSmaSlow);

    std::map<std::string, bool> conditions;
    conditions["rsi_cross_up"] = (prev_rsi < profile.rsi_low) && (rsi >= profile.rsi_low);
    conditions["rsi_oversold"] = rsi <= profile.rsi_low;
    conditions["volume_confirmation"] = volumeConfirmed(window);
    conditions["trend_filter"] = cur.close > sma_slow;
    return conditions;
}

// Price makes a new high over the lookback while RSI does not.
bool RsiStrategy::bearishDivergence(const std::vector<PriceBar>& window) {
    if (window.size() < kDivergenceLookback + 1) {
        return false;
    }
    const PriceBar& cur = window.back();
    auto cur_rsi = cur.indicator(col::kRsi);
    if (!cur_rsi) {
        return false;
    }

    const PriceBar* prior_high = nullptr;
    for (size_t i = window.size() - 1 - kDivergenceLookback; i < window.size() - 1; ++i) {
        if (prior_high == nullptr || window[i].close > prior_high->close) {
            prior_high = &window[i];
        }
    }
    if (prior_high == nullptr || cur.close <= prior_high->close) {
        return false;
    }
    auto prior_rsi = prior_high->indicator(col::kRsi);
    return prior_rsi && *cur_rsi < *prior_rsi;
}

} // namespace strategy
} // namespace stocktrade
