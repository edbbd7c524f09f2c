#include "risk/RiskLimits.h"
#include "common/Errors.h"

namespace stocktrade {
namespace risk {

const char* toString(StopMethod method) {
    switch (method) {
        case StopMethod::FIXED_PERCENT: return "fixed";
        case StopMethod::ATR_MULTIPLE: return "atr";
        case StopMethod::TRAILING: return "trailing";
    }
    return "fixed";
}

std::optional<StopMethod> stopMethodFromString(const std::string& value) {
    if (value == "fixed" || value == "fixed_percent") return StopMethod::FIXED_PERCENT;
    if (value == "atr" || value == "atr_multiple") return StopMethod::ATR_MULTIPLE;
    if (value == "trailing") return StopMethod::TRAILING;
    return std::nullopt;
}

void RiskLimits::validate() const {
    if (max_position_size_pct <= 0.0 || max_position_size_pct > 1.0) {
        throw ConfigError("risk.max_position_size_pct must be within (0, 1]");
    }
    if (transaction_limit_pct <= 0.0 || transaction_limit_pct > 1.0) {
        throw ConfigError("risk.transaction_limit_pct must be within (0, 1]");
    }
    if (max_positions < 1) {
        throw ConfigError("risk.max_positions must be at least 1");
    }
    if (stop_loss_pct < 0.0 || stop_loss_pct >= 1.0) {
        throw ConfigError("risk.stop_loss_pct must be within [0, 1)");
    }
    if (take_profit_pct < 0.0) {
        throw ConfigError("risk.take_profit_pct must not be negative");
    }
    if (safe_cash_floor < 0.0) {
        throw ConfigError("risk.safe_cash_floor must not be negative");
    }
    if (atr_multiplier <= 0.0) {
        throw ConfigError("risk.atr_multiplier must be positive");
    }
    if (trailing_stop_pct <= 0.0 || trailing_stop_pct >= 1.0) {
        throw ConfigError("risk.trailing_stop_pct must be within (0, 1)");
    }
}

} // namespace risk
} // namespace stocktrade
