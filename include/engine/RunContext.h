#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "analytics/PerformanceAnalyzer.h"
#include "core/contracts/IMarketDataSource.h"
#include "execution/PaperBroker.h"
#include "risk/RiskLimits.h"
#include "strategy/StrategyConfig.h"

namespace stocktrade {
namespace engine {

// Checked between bars; cancel() may be called from another thread.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct AutomationSettings {
    int cycle_interval_seconds = 300;
    bool market_hours_only = true;
    int market_open_minute_utc = 14 * 60 + 30;   // 09:30 New York, standard time
    int market_close_minute_utc = 21 * 60;       // 16:00 New York
    int lookback_days = 120;                     // calendar days loaded per tick
};

// Everything one run needs. Passed into the Engine by value; no globals.
struct RunContext {
    std::vector<std::string> symbols;
    TimestampMs start_ms = 0;
    TimestampMs end_ms = 0;
    double initial_capital = 100000.0;

    strategy::StrategyKind strategy_kind = strategy::StrategyKind::MACD;
    strategy::StrategyProfile profile;

    risk::RiskLimits risk_limits;
    execution::BrokerSettings broker;
    double risk_free_rate = 0.02;
    analytics::PerformanceOptions performance;
    AutomationSettings automation;

    std::shared_ptr<core::IMarketDataSource> data_source;
    std::shared_ptr<CancelToken> cancel_token;
};

} // namespace engine
} // namespace stocktrade
