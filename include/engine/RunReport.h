#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "analytics/PerformanceAnalyzer.h"
#include "common/Types.h"

namespace stocktrade {
namespace engine {

struct RejectedSignal {
    std::string symbol;
    TimestampMs at = 0;
    std::string code;
    std::string reason;
};

struct SymbolError {
    std::string symbol;
    TimestampMs at = 0;
    std::string message;
};

// Output of one automation cycle.
struct CycleResult {
    TimestampMs at = 0;
    int analysis_count = 0;
    int signals_generated = 0;
    int trades_executed = 0;
    int errors = 0;
    // Symbols whose newest bar was already processed by an earlier cycle
    int stale_symbols = 0;
    bool skipped = false;
    std::string skip_reason;
    std::vector<Trade> closed_trades;
    std::vector<RejectedSignal> rejected_signals;
    std::vector<SymbolError> symbol_errors;

    nlohmann::json toJson() const;
};

// The only surface the presentation layer consumes.
struct RunReport {
    std::string strategy_id;
    std::string profile_id;
    double initial_capital = 0.0;
    double final_value = 0.0;
    int bars_processed = 0;
    int signals_generated = 0;
    bool cancelled = false;

    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    analytics::PerformanceReport performance;
    std::vector<RejectedSignal> rejected_signals;
    std::vector<SymbolError> symbol_errors;

    nlohmann::json toJson() const;
};

} // namespace engine
} // namespace stocktrade
