#pragma once

#include <string>
#include <vector>

#include "engine/EngineState.h"
#include "engine/RunContext.h"
#include "engine/RunReport.h"
#include "execution/PositionManager.h"
#include "risk/RiskManager.h"
#include "strategy/StrategyManager.h"

namespace stocktrade {
namespace engine {

// Orchestrates load -> evaluate -> risk check -> execute -> record, either
// over a historical range (runBacktest) or once per external tick (runCycle).
// Single-threaded: symbols are processed one after another so that cash and
// position-count reads and writes stay serialized.
class Engine {
public:
    // Throws ConfigError for an invalid context.
    explicit Engine(RunContext context);

    // Deterministic for identical data and configuration.
    RunReport runBacktest();

    // One automation cycle at wall-clock `now` against a caller-owned book.
    // Symbols whose newest bar was handled by an earlier cycle are skipped.
    CycleResult runCycle(TimestampMs now, execution::PositionManager& positions);

    EngineState state() const { return state_; }
    const RunContext& context() const { return context_; }
    const strategy::StrategyManager& strategies() const { return strategies_; }
    const risk::RiskManager& riskManager() const { return risk_; }

    execution::PaperBroker makeBroker() const { return execution::PaperBroker(context_.broker); }

    // Weekdays, UTC minute-of-day within [open, close)
    static bool isMarketOpen(TimestampMs now, const AutomationSettings& settings);

private:
    // window.back() is the bar being processed
    struct SymbolWindow {
        std::string symbol;
        std::vector<PriceBar> window;
    };

    struct CycleOptions {
        bool allow_entries = true;
        bool liquidate = false;
    };

    void transitionTo(EngineState next);
    // COMPLETE goes back through the table; a run that threw mid-cycle is reset.
    void resetToIdle();
    bool cancelled() const;

    std::vector<PriceBar> loadSymbol(const std::string& symbol, TimestampMs start_ms, TimestampMs end_ms);
    std::vector<PriceBar> tail(const std::vector<PriceBar>& bars, size_t end_index) const;

    // Runs from LOADING_DATA (data already loaded) through RECORDING.
    void processCycle(TimestampMs at,
                      const std::vector<SymbolWindow>& windows,
                      execution::PositionManager& positions,
                      CycleResult& result,
                      const CycleOptions& options);

    RunContext context_;
    strategy::StrategyManager strategies_;
    risk::RiskManager risk_;
    size_t window_size_;
    EngineState state_ = EngineState::IDLE;
};

} // namespace engine
} // namespace stocktrade
