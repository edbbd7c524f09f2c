#include "risk/RiskManager.h"
#include "analytics/IndicatorColumns.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace stocktrade {
namespace risk {

const char* toString(RejectionCode code) {
    switch (code) {
        case RejectionCode::NONE: return "NONE";
        case RejectionCode::INVALID_PRICE: return "INVALID_PRICE";
        case RejectionCode::SYMBOL_ALREADY_OPEN: return "SYMBOL_ALREADY_OPEN";
        case RejectionCode::MAX_POSITIONS_REACHED: return "MAX_POSITIONS_REACHED";
        case RejectionCode::INSUFFICIENT_CASH: return "INSUFFICIENT_CASH";
        case RejectionCode::ZERO_SHARES: return "ZERO_SHARES";
    }
    return "UNKNOWN";
}

const char* toString(BindingConstraint constraint) {
    switch (constraint) {
        case BindingConstraint::POSITION_SIZE_PCT: return "position_size_pct";
        case BindingConstraint::CASH_AVAILABLE: return "cash_available";
        case BindingConstraint::TRANSACTION_LIMIT: return "transaction_limit";
    }
    return "unknown";
}

RiskManager::RiskManager(RiskLimits limits, double cost_rate)
    : limits_(std::move(limits))
    , cost_rate_(std::max(0.0, cost_rate))
{}

Amount RiskManager::cashForTrading(const PortfolioState& portfolio) const {
    return std::max(0.0, portfolio.cash_balance - limits_.safe_cash_floor);
}

SizingResult RiskManager::sizePosition(
    const strategy::Signal& signal,
    Price current_price,
    const PortfolioState& portfolio
) const {
    SizingResult result;

    auto reject = [&](RejectionCode code, std::string reason) {
        result.accepted = false;
        result.rejection = code;
        result.reason = std::move(reason);
        LOG_INFO("[Risk] {} rejected: {}", signal.symbol, result.reason);
        return result;
    };

    if (!(current_price > 0.0) || !std::isfinite(current_price)) {
        return reject(RejectionCode::INVALID_PRICE,
                      fmt::format("invalid price {:.4f}", current_price));
    }

    // ===== Hard stops =====
    if (portfolio.hasPosition(signal.symbol)) {
        return reject(RejectionCode::SYMBOL_ALREADY_OPEN,
                      fmt::format("position already open for {}", signal.symbol));
    }
    if (static_cast<int>(portfolio.positions.size()) >= limits_.max_positions) {
        return reject(RejectionCode::MAX_POSITIONS_REACHED,
                      fmt::format("max positions reached ({}/{})",
                                  portfolio.positions.size(), limits_.max_positions));
    }

    const Amount trading_cash = cashForTrading(portfolio);
    if (trading_cash <= 0.0) {
        return reject(RejectionCode::INSUFFICIENT_CASH,
                      fmt::format("cash {:.2f} at or below safe floor {:.2f}",
                                  portfolio.cash_balance, limits_.safe_cash_floor));
    }

    // ===== Intelligent sizing =====
    result.optimal_value = portfolio.totalValue() * limits_.max_position_size_pct;
    result.cash_limit_value = trading_cash / (1.0 + cost_rate_);
    result.transaction_limit_value = trading_cash * limits_.transaction_limit_pct;

    Amount value = result.optimal_value;
    result.binding = BindingConstraint::POSITION_SIZE_PCT;
    if (result.transaction_limit_value < value) {
        value = result.transaction_limit_value;
        result.binding = BindingConstraint::TRANSACTION_LIMIT;
    }
    if (result.cash_limit_value < value) {
        value = result.cash_limit_value;
        result.binding = BindingConstraint::CASH_AVAILABLE;
    }

    Shares shares = value / current_price;
    if (!limits_.allow_fractional_shares) {
        shares = std::floor(shares);
        // guard against 2000 / 100 landing on 19.999...
        if ((shares + 1.0) * current_price <= value * (1.0 + 1e-12)) {
            shares += 1.0;
        }
    }

    if (shares <= 0.0) {
        return reject(RejectionCode::ZERO_SHARES,
                      fmt::format("sized value {:.2f} ({}) buys no shares at {:.2f}",
                                  value, toString(result.binding), current_price));
    }

    result.accepted = true;
    result.shares = shares;
    result.position_value = shares * current_price;

    if (result.binding == BindingConstraint::POSITION_SIZE_PCT) {
        result.reason = fmt::format("sized at {:.1f}% of portfolio: {:.2f}",
                                    limits_.max_position_size_pct * 100.0, result.position_value);
    } else {
        result.reason = fmt::format("shrunk from {:.2f} to {:.2f} by {} limit",
                                    result.optimal_value, result.position_value,
                                    toString(result.binding));
    }
    LOG_INFO("[Risk] {} accepted: {} shares, {}", signal.symbol, shares, result.reason);
    return result;
}

double RiskManager::stopLossPct(const strategy::StrategyProfile* profile) const {
    if (profile != nullptr && profile->stop_loss_pct > 0.0) {
        return profile->stop_loss_pct;
    }
    return limits_.stop_loss_pct;
}

double RiskManager::takeProfitPct(const strategy::StrategyProfile* profile) const {
    if (profile != nullptr && profile->take_profit_pct > 0.0) {
        return profile->take_profit_pct;
    }
    return limits_.take_profit_pct;
}

RiskLevels RiskManager::computeLevels(
    Price entry_price,
    const PriceBar& bar,
    const strategy::StrategyProfile* profile
) const {
    RiskLevels levels;
    const double sl_pct = stopLossPct(profile);
    const double tp_pct = takeProfitPct(profile);

    switch (limits_.stop_method) {
        case StopMethod::ATR_MULTIPLE: {
            auto atr = bar.indicator(analytics::columns::kAtr);
            if (atr && *atr > 0.0) {
                levels.stop_loss_price = std::max(0.0, entry_price - (*atr * limits_.atr_multiplier));
            } else {
                LOG_DEBUG("[Risk] {} ATR unavailable, using fixed stop", bar.symbol);
                levels.stop_loss_price = entry_price * (1.0 - sl_pct);
            }
            break;
        }
        case StopMethod::TRAILING:
            levels.stop_loss_price = entry_price * (1.0 - limits_.trailing_stop_pct);
            break;
        case StopMethod::FIXED_PERCENT:
            levels.stop_loss_price = entry_price * (1.0 - sl_pct);
            break;
    }

    levels.take_profit_price = (tp_pct > 0.0) ? entry_price * (1.0 + tp_pct) : 0.0;
    levels.max_hold_days = (profile != nullptr) ? profile->max_hold_days : 0;
    return levels;
}

std::optional<Price> RiskManager::trailingStop(const Position& position) const {
    if (limits_.stop_method != StopMethod::TRAILING) {
        return std::nullopt;
    }
    const double new_stop = position.highest_price * (1.0 - limits_.trailing_stop_pct);
    if (new_stop <= position.stop_loss_price) {
        return std::nullopt;
    }
    return new_stop;
}

std::optional<ExitDecision> RiskManager::checkExit(const Position& position, const PriceBar& bar) const {
    // The entry bar, or anything older, cannot trigger an exit
    if (bar.timestamp <= position.opened_at) {
        return std::nullopt;
    }
    if (position.stop_loss_price > 0.0 && bar.low <= position.stop_loss_price) {
        // Gap through the stop fills at the open
        const Price fill = std::min(position.stop_loss_price, bar.open);
        const ExitReason reason = (limits_.stop_method == StopMethod::TRAILING)
            ? ExitReason::TRAILING_STOP : ExitReason::STOP_LOSS;
        return ExitDecision{reason, fill};
    }

    if (position.take_profit_price > 0.0 && bar.high >= position.take_profit_price) {
        const Price fill = std::max(position.take_profit_price, bar.open);
        return ExitDecision{ExitReason::TAKE_PROFIT, fill};
    }

    if (position.max_hold_days > 0) {
        const long long held_ms = bar.timestamp - position.opened_at;
        if (held_ms >= static_cast<long long>(position.max_hold_days) * kMillisPerDay) {
            return ExitDecision{ExitReason::MAX_HOLD, bar.close};
        }
    }
    return std::nullopt;
}

} // namespace risk
} // namespace stocktrade
