#include "analytics/PerformanceAnalyzer.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace stocktrade {
namespace analytics {

namespace {
constexpr double kEpsilon = 1e-12;
constexpr double kTailProbability = 0.05;

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Sample standard deviation (n - 1)
double stdDev(const std::vector<double>& values, double avg) {
    if (values.size() < 2) return 0.0;
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - avg) * (v - avg);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

nlohmann::json optionalJson(const std::optional<double>& value) {
    if (!value || !std::isfinite(*value)) {
        return nullptr;
    }
    return *value;
}

struct TradeStats {
    int trades = 0;
    int wins = 0;
    int losses = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;
    double hold_days_sum = 0.0;
};

// year * 12 + (month - 1) for a UTC timestamp
long long monthKey(TimestampMs ts) {
    long long z = ts / kMillisPerDay;
    if (ts % kMillisPerDay < 0) {
        --z;
    }
    // civil_from_days, proleptic Gregorian
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const long long month = mp < 10 ? mp + 3 : mp - 9;
    const long long year = yoe + era * 400 + (month <= 2 ? 1 : 0);
    return year * 12 + (month - 1);
}

void accumulateStats(TradeStats& s, const Trade& trade) {
    s.trades++;
    s.net_profit += trade.pnl_dollars;
    s.hold_days_sum += trade.holdDays();
    if (trade.pnl_dollars > 0.0) {
        s.wins++;
        s.gross_profit += trade.pnl_dollars;
        s.largest_win = std::max(s.largest_win, trade.pnl_dollars);
    } else if (trade.pnl_dollars < 0.0) {
        s.losses++;
        s.gross_loss_abs += std::abs(trade.pnl_dollars);
        s.largest_loss = std::min(s.largest_loss, trade.pnl_dollars);
    }
}
}

std::vector<double> PerformanceAnalyzer::periodReturns(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }
    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].total_value;
        if (prev <= kEpsilon) {
            continue;
        }
        returns.push_back(equity_curve[i].total_value / prev - 1.0);
    }
    return returns;
}

std::vector<double> PerformanceAnalyzer::monthlyReturns(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> months;
    if (equity_curve.size() < 2) {
        return months;
    }

    double base = equity_curve.front().total_value;
    long long current = monthKey(equity_curve[1].timestamp);
    auto closeMonth = [&](double end_value) {
        if (base > kEpsilon) {
            months.push_back(end_value / base - 1.0);
        }
        base = end_value;
    };

    for (size_t i = 2; i < equity_curve.size(); ++i) {
        const long long key = monthKey(equity_curve[i].timestamp);
        if (key != current) {
            closeMonth(equity_curve[i - 1].total_value);
            current = key;
        }
    }
    closeMonth(equity_curve.back().total_value);
    return months;
}

DrawdownStats PerformanceAnalyzer::maxDrawdown(const std::vector<EquityPoint>& equity_curve) {
    DrawdownStats stats;
    if (equity_curve.empty()) {
        return stats;
    }

    double peak = equity_curve.front().total_value;
    size_t peak_index = 0;
    TimestampMs peak_at = equity_curve.front().timestamp;

    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double value = equity_curve[i].total_value;
        if (value >= peak) {
            peak = value;
            peak_index = i;
            peak_at = equity_curve[i].timestamp;
            continue;
        }

        const int duration = static_cast<int>(i - peak_index);
        stats.max_duration_bars = std::max(stats.max_duration_bars, duration);

        if (peak > kEpsilon) {
            const double dd = (peak - value) / peak;
            if (dd > stats.max_drawdown) {
                stats.max_drawdown = dd;
                stats.peak_at = peak_at;
                stats.trough_at = equity_curve[i].timestamp;
            }
        }
    }
    return stats;
}

PerformanceReport PerformanceAnalyzer::compute(
    const std::vector<Trade>& trades,
    const std::vector<EquityPoint>& equity_curve,
    double risk_free_rate,
    const PerformanceOptions& options
) {
    PerformanceReport report;

    if (!equity_curve.empty()) {
        report.initial_value = equity_curve.front().total_value;
        report.final_value = equity_curve.back().total_value;
        if (report.initial_value > kEpsilon) {
            report.total_return = report.final_value / report.initial_value - 1.0;
        }
    }
    report.drawdown = maxDrawdown(equity_curve);

    const auto months = monthlyReturns(equity_curve);
    if (!months.empty()) {
        report.best_month = *std::max_element(months.begin(), months.end());
        report.worst_month = *std::min_element(months.begin(), months.end());
        for (double r : months) {
            if (r > 0.0) report.positive_months++;
            else if (r < 0.0) report.negative_months++;
        }
    }

    // ===== Trade ledger statistics =====
    TradeStats s;
    for (const auto& trade : trades) {
        accumulateStats(s, trade);
    }
    report.total_trades = s.trades;
    report.winning_trades = s.wins;
    report.losing_trades = s.losses;
    report.net_profit = s.net_profit;

    report.insufficient_sample = (s.trades == 0);
    if (report.insufficient_sample) {
        return report;
    }

    const double n = static_cast<double>(s.trades);
    report.win_rate = static_cast<double>(s.wins) / n;
    report.expectancy = s.net_profit / n;
    report.avg_hold_days = s.hold_days_sum / n;
    if (s.gross_loss_abs > kEpsilon) {
        report.profit_factor = s.gross_profit / s.gross_loss_abs;
    }
    if (s.wins > 0) {
        report.avg_win = s.gross_profit / static_cast<double>(s.wins);
        report.largest_win = s.largest_win;
    }
    if (s.losses > 0) {
        report.avg_loss = -s.gross_loss_abs / static_cast<double>(s.losses);
        report.largest_loss = s.largest_loss;
    }

    // ===== Equity-curve ratios =====
    const auto returns = periodReturns(equity_curve);
    if (returns.empty()) {
        return report;
    }

    const double af = options.annualization_factor;
    const double periods = static_cast<double>(returns.size());
    if (report.initial_value > kEpsilon && report.final_value > 0.0) {
        report.annualized_return =
            std::pow(report.final_value / report.initial_value, af / periods) - 1.0;
    }

    const double avg = mean(returns);
    const double sd = stdDev(returns, avg);
    if (returns.size() >= 2) {
        report.volatility = sd * std::sqrt(af);
    }

    const double rf_period = risk_free_rate / af;
    if (sd > kEpsilon) {
        report.sharpe = (avg - rf_period) / sd * std::sqrt(af);
    }

    double downside_sq = 0.0;
    for (double r : returns) {
        const double shortfall = std::min(0.0, r - options.sortino_target);
        downside_sq += shortfall * shortfall;
    }
    const double downside_dev = std::sqrt(downside_sq / periods);
    if (downside_dev > kEpsilon) {
        report.sortino = (avg - rf_period) / downside_dev * std::sqrt(af);
    }

    if (report.annualized_return && report.drawdown.max_drawdown > kEpsilon) {
        report.calmar = *report.annualized_return / std::abs(report.drawdown.max_drawdown);
    }

    double gains = 0.0;
    double losses = 0.0;
    for (double r : returns) {
        if (r > options.omega_threshold) gains += r - options.omega_threshold;
        else losses += options.omega_threshold - r;
    }
    if (losses > kEpsilon) {
        report.omega = gains / losses;
    }

    // Historical VaR / CVaR at 95%
    std::vector<double> sorted = returns;
    std::sort(sorted.begin(), sorted.end());
    const size_t tail = std::max<size_t>(1, static_cast<size_t>(std::floor(kTailProbability * periods)));
    report.var_95 = sorted[tail - 1];
    report.cvar_95 = std::accumulate(sorted.begin(), sorted.begin() + tail, 0.0) / static_cast<double>(tail);

    return report;
}

nlohmann::json PerformanceReport::toJson() const {
    nlohmann::json j;
    j["initial_value"] = initial_value;
    j["final_value"] = final_value;
    j["total_return"] = total_return;
    j["annualized_return"] = optionalJson(annualized_return);
    j["volatility"] = optionalJson(volatility);
    j["sharpe_ratio"] = optionalJson(sharpe);
    j["sortino_ratio"] = optionalJson(sortino);
    j["calmar_ratio"] = optionalJson(calmar);
    j["omega_ratio"] = optionalJson(omega);
    j["max_drawdown"] = drawdown.max_drawdown;
    j["max_drawdown_duration"] = drawdown.max_duration_bars;
    j["var_95"] = optionalJson(var_95);
    j["cvar_95"] = optionalJson(cvar_95);
    j["best_month"] = optionalJson(best_month);
    j["worst_month"] = optionalJson(worst_month);
    j["positive_months"] = positive_months;
    j["negative_months"] = negative_months;
    j["total_trades"] = total_trades;
    j["winning_trades"] = winning_trades;
    j["losing_trades"] = losing_trades;
    j["win_rate"] = optionalJson(win_rate);
    j["profit_factor"] = optionalJson(profit_factor);
    j["avg_win"] = optionalJson(avg_win);
    j["avg_loss"] = optionalJson(avg_loss);
    j["largest_win"] = optionalJson(largest_win);
    j["largest_loss"] = optionalJson(largest_loss);
    j["avg_hold_days"] = optionalJson(avg_hold_days);
    j["expectancy"] = optionalJson(expectancy);
    j["net_profit"] = net_profit;
    j["insufficient_sample"] = insufficient_sample;
    return j;
}

} // namespace analytics
} // namespace stocktrade
