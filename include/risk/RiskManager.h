#pragma once

#include "common/Types.h"
#include "risk/RiskLimits.h"
#include "strategy/IStrategy.h"
#include <optional>
#include <string>

namespace stocktrade {
namespace risk {

enum class RejectionCode {
    NONE,
    INVALID_PRICE,
    SYMBOL_ALREADY_OPEN,
    MAX_POSITIONS_REACHED,
    INSUFFICIENT_CASH,
    ZERO_SHARES
};

enum class BindingConstraint {
    POSITION_SIZE_PCT,
    CASH_AVAILABLE,
    TRANSACTION_LIMIT
};

const char* toString(RejectionCode code);
const char* toString(BindingConstraint constraint);

struct SizingResult {
    bool accepted;
    Shares shares;
    Amount position_value;          // shares x price actually used
    Amount optimal_value;           // total value x max_position_size_pct
    Amount cash_limit_value;        // trading cash net of fees
    Amount transaction_limit_value; // trading cash x transaction_limit_pct
    BindingConstraint binding;
    RejectionCode rejection;
    std::string reason;

    SizingResult()
        : accepted(false), shares(0), position_value(0), optimal_value(0)
        , cash_limit_value(0), transaction_limit_value(0)
        , binding(BindingConstraint::POSITION_SIZE_PCT)
        , rejection(RejectionCode::NONE)
    {}
};

struct RiskLevels {
    Price stop_loss_price = 0.0;
    Price take_profit_price = 0.0;
    int max_hold_days = 0;
};

struct ExitDecision {
    ExitReason reason;
    Price price;
};

// Risk Manager: sizing and stop/target policy. Reads portfolio state, never mutates it.
class RiskManager {
public:
    // cost_rate: commission + slippage as a fraction of notional
    RiskManager(RiskLimits limits, double cost_rate);

    const RiskLimits& limits() const { return limits_; }

    // ===== Sizing =====

    // Shrinks the position to the largest size satisfying every limit.
    // Rejects only when no whole share fits (or a hard stop applies).
    SizingResult sizePosition(const strategy::Signal& signal,
                              Price current_price,
                              const PortfolioState& portfolio) const;

    // cash above the safe floor
    Amount cashForTrading(const PortfolioState& portfolio) const;

    // ===== Stops / targets =====

    // Levels at acceptance time. Profile stop/target values take precedence when > 0.
    RiskLevels computeLevels(Price entry_price,
                             const PriceBar& bar,
                             const strategy::StrategyProfile* profile) const;

    // New trailing stop at highest_price x (1 - trailing_stop_pct) when it is
    // above the current stop; std::nullopt otherwise (stops never loosen).
    std::optional<Price> trailingStop(const Position& position) const;

    // First triggered of: stop loss, take profit, max hold. Bars at or before
    // opened_at never trigger.
    std::optional<ExitDecision> checkExit(const Position& position, const PriceBar& bar) const;

private:
    double stopLossPct(const strategy::StrategyProfile* profile) const;
    double takeProfitPct(const strategy::StrategyProfile* profile) const;

    RiskLimits limits_;
    double cost_rate_;
};

} // namespace risk
} // namespace stocktrade
