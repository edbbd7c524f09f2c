#pragma once

#include "common/Types.h"
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace stocktrade {
namespace analytics {

struct PerformanceOptions {
    double annualization_factor = 252.0;
    double sortino_target = 0.0;     // per-period target return
    double omega_threshold = 0.0;    // per-period threshold return
};

struct DrawdownStats {
    double max_drawdown = 0.0;       // fraction of the running peak, >= 0
    int max_duration_bars = 0;       // longest stretch below a prior peak
    TimestampMs peak_at = 0;
    TimestampMs trough_at = 0;
};

// Undefined ratios are std::nullopt (serialized as null).
struct PerformanceReport {
    double initial_value = 0.0;
    double final_value = 0.0;
    double total_return = 0.0;
    std::optional<double> annualized_return;
    std::optional<double> volatility;

    std::optional<double> sharpe;
    std::optional<double> sortino;
    std::optional<double> calmar;
    std::optional<double> omega;

    DrawdownStats drawdown;
    std::optional<double> var_95;
    std::optional<double> cvar_95;

    // Calendar-month (UTC) compounded returns of the equity curve
    std::optional<double> best_month;
    std::optional<double> worst_month;
    int positive_months = 0;
    int negative_months = 0;

    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    std::optional<double> win_rate;
    std::optional<double> profit_factor;
    std::optional<double> avg_win;
    std::optional<double> avg_loss;
    std::optional<double> largest_win;
    std::optional<double> largest_loss;
    std::optional<double> avg_hold_days;
    std::optional<double> expectancy;
    double net_profit = 0.0;

    bool insufficient_sample = true;

    nlohmann::json toJson() const;
};

class PerformanceAnalyzer {
public:
    static PerformanceReport compute(const std::vector<Trade>& trades,
                                     const std::vector<EquityPoint>& equity_curve,
                                     double risk_free_rate,
                                     const PerformanceOptions& options = PerformanceOptions());

    // Single pass over the curve: running peak and deepest decline from it.
    static DrawdownStats maxDrawdown(const std::vector<EquityPoint>& equity_curve);

    static std::vector<double> periodReturns(const std::vector<EquityPoint>& equity_curve);

    // One compounded return per UTC calendar month, oldest first. A period
    // return belongs to the month of its closing point.
    static std::vector<double> monthlyReturns(const std::vector<EquityPoint>& equity_curve);
};

} // namespace analytics
} // namespace stocktrade
