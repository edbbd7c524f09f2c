#pragma once

#include <optional>
#include <string>

namespace stocktrade {
namespace risk {

enum class StopMethod {
    FIXED_PERCENT,
    ATR_MULTIPLE,
    TRAILING
};

const char* toString(StopMethod method);
std::optional<StopMethod> stopMethodFromString(const std::string& value);

// Portfolio-level risk settings, one immutable snapshot per run.
// Percentages are fractions.
struct RiskLimits {
    double max_position_size_pct = 0.08;
    double transaction_limit_pct = 0.02;
    int max_positions = 10;
    double stop_loss_pct = 0.05;
    double take_profit_pct = 0.20;
    double safe_cash_floor = 10000.0;

    StopMethod stop_method = StopMethod::FIXED_PERCENT;
    double atr_multiplier = 2.0;
    double trailing_stop_pct = 0.01;
    bool allow_fractional_shares = false;

    // Throws ConfigError
    void validate() const;
};

} // namespace risk
} // namespace stocktrade
