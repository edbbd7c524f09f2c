#include "analytics/IndicatorColumns.h"
#include "common/Errors.h"
#include "risk/RiskManager.h"
#include "strategy/StrategyCatalog.h"

#include <cmath>
#include <iostream>
#include <string>

using namespace stocktrade;
using namespace stocktrade::risk;

namespace {
int fail(const std::string& message) {
    std::cerr << "[TEST] " << message << "\n";
    return 1;
}

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}

strategy::Signal entrySignal(const std::string& symbol, double price) {
    strategy::Signal s;
    s.symbol = symbol;
    s.direction = strategy::SignalDirection::ENTER_LONG;
    s.strategy_id = "macd";
    s.profile_id = "balanced";
    s.confidence = 1.0;
    s.price = price;
    return s;
}

PortfolioState cashOnly(double cash) {
    PortfolioState p;
    p.cash_balance = cash;
    return p;
}

Position openPosition(const std::string& symbol, double shares, double price) {
    Position pos;
    pos.symbol = symbol;
    pos.shares = shares;
    pos.average_entry_price = price;
    pos.current_price = price;
    pos.highest_price = price;
    return pos;
}

PriceBar bar(TimestampMs at, double open, double high, double low, double close) {
    return PriceBar("AAPL", at, open, high, low, close, 1000.0);
}
}

int main() {
    // ===== Intelligent sizing scenario: $100k, 8% / 2%, no floor =====
    {
        RiskLimits limits;
        limits.safe_cash_floor = 0.0;
        RiskManager risk(limits, 0.0);

        auto result = risk.sizePosition(entrySignal("AAPL", 100.0), 100.0, cashOnly(100000.0));
        if (!result.accepted) {
            return fail("sizing should accept: " + result.reason);
        }
        if (!near(result.optimal_value, 8000.0) || !near(result.transaction_limit_value, 2000.0)) {
            return fail("optimal / transaction values mismatch");
        }
        if (result.binding != BindingConstraint::TRANSACTION_LIMIT) {
            return fail(std::string("binding should be transaction_limit, got ") + toString(result.binding));
        }
        if (result.shares != 20.0 || !near(result.position_value, 2000.0)) {
            return fail("expected 20 shares worth 2000, got " + std::to_string(result.shares));
        }
        if (result.reason.find("transaction_limit") == std::string::npos) {
            return fail("reason should name the binding limit: " + result.reason);
        }
    }

    // Default floor ($10k) shrinks trading cash before the 2% limit applies
    {
        RiskManager risk(RiskLimits(), 0.0);
        auto result = risk.sizePosition(entrySignal("AAPL", 100.0), 100.0, cashOnly(100000.0));
        if (!result.accepted || result.shares != 18.0 || !near(risk.cashForTrading(cashOnly(100000.0)), 90000.0)) {
            return fail("floor-adjusted sizing should buy 18 shares");
        }
    }

    // Position size percentage binds when the per-trade limit is loose
    {
        RiskLimits limits;
        limits.safe_cash_floor = 0.0;
        limits.transaction_limit_pct = 1.0;
        RiskManager risk(limits, 0.0);
        auto result = risk.sizePosition(entrySignal("AAPL", 50.0), 50.0, cashOnly(100000.0));
        if (!result.accepted || result.binding != BindingConstraint::POSITION_SIZE_PCT || result.shares != 160.0) {
            return fail("position size pct should bind at 160 shares");
        }
    }

    // Cash limit binds and the fee-inclusive debit stays within trading cash
    {
        RiskLimits limits;
        limits.transaction_limit_pct = 1.0;
        limits.max_position_size_pct = 1.0;
        const double cost_rate = 0.01;
        RiskManager risk(limits, cost_rate);
        PortfolioState portfolio = cashOnly(10500.0);

        auto result = risk.sizePosition(entrySignal("AAPL", 100.0), 100.0, portfolio);
        if (!result.accepted || result.binding != BindingConstraint::CASH_AVAILABLE) {
            return fail("cash limit should bind");
        }
        const double debit = result.shares * 100.0 * (1.0 + cost_rate);
        if (result.shares != 4.0 || debit > risk.cashForTrading(portfolio) + 1e-9) {
            return fail("fee-inclusive debit exceeds trading cash");
        }
    }

    // Sizing law over a grid of prices: never above any of the three limits
    {
        RiskLimits limits;
        RiskManager risk(limits, 0.002);
        PortfolioState portfolio = cashOnly(60000.0);
        portfolio.positions["MSFT"] = openPosition("MSFT", 100.0, 250.0);
        for (double price : {0.5, 3.7, 12.0, 99.99, 250.0, 777.0}) {
            auto result = risk.sizePosition(entrySignal("AAPL", price), price, portfolio);
            if (!result.accepted) {
                continue;
            }
            const double value = result.shares * price;
            if (value > result.optimal_value + 1e-9 ||
                value > result.transaction_limit_value + 1e-9 ||
                value > result.cash_limit_value + 1e-9) {
                return fail("sized value breaks a limit at price " + std::to_string(price));
            }
            if (result.shares != std::floor(result.shares)) {
                return fail("whole shares expected");
            }
        }
    }

    // Fractional shares
    {
        RiskLimits limits;
        limits.allow_fractional_shares = true;
        RiskManager risk(limits, 0.0);
        auto result = risk.sizePosition(entrySignal("AAPL", 7.0), 7.0, cashOnly(100000.0));
        if (!result.accepted || !near(result.shares, 1800.0 / 7.0, 1e-9)) {
            return fail("fractional sizing mismatch");
        }
    }

    // ===== Rejections =====
    {
        RiskLimits limits;
        limits.max_positions = 2;
        RiskManager risk(limits, 0.0);

        if (risk.sizePosition(entrySignal("AAPL", 0.0), 0.0, cashOnly(100000.0)).rejection != RejectionCode::INVALID_PRICE) {
            return fail("zero price should be INVALID_PRICE");
        }

        PortfolioState one = cashOnly(100000.0);
        one.positions["AAPL"] = openPosition("AAPL", 10.0, 100.0);
        auto dup = risk.sizePosition(entrySignal("AAPL", 100.0), 100.0, one);
        if (dup.accepted || dup.rejection != RejectionCode::SYMBOL_ALREADY_OPEN) {
            return fail("second entry on an open symbol should be rejected");
        }

        PortfolioState full = one;
        full.positions["MSFT"] = openPosition("MSFT", 10.0, 100.0);
        auto max = risk.sizePosition(entrySignal("NVDA", 100.0), 100.0, full);
        if (max.accepted || max.rejection != RejectionCode::MAX_POSITIONS_REACHED) {
            return fail("max positions should reject");
        }

        auto broke = risk.sizePosition(entrySignal("NVDA", 100.0), 100.0, cashOnly(10000.0));
        if (broke.accepted || broke.rejection != RejectionCode::INSUFFICIENT_CASH) {
            return fail("cash at the floor should reject");
        }

        auto pricey = risk.sizePosition(entrySignal("NVDA", 5000.0), 5000.0, cashOnly(100000.0));
        if (pricey.accepted || pricey.rejection != RejectionCode::ZERO_SHARES || pricey.reason.empty()) {
            return fail("a share above the sized value should reject with ZERO_SHARES");
        }
    }

    // ===== Stop / target levels =====
    {
        RiskManager fixed(RiskLimits(), 0.0);
        const PriceBar b = bar(0, 100, 101, 99, 100);

        auto levels = fixed.computeLevels(100.0, b, nullptr);
        if (!near(levels.stop_loss_price, 95.0) || !near(levels.take_profit_price, 120.0) || levels.max_hold_days != 0) {
            return fail("fixed levels from RiskLimits mismatch");
        }

        const auto catalog = strategy::StrategyCatalog::builtin();
        const auto& profile = catalog.profile(strategy::StrategyKind::MACD, "balanced");
        auto profiled = fixed.computeLevels(100.0, b, &profile);
        if (!near(profiled.stop_loss_price, 97.0) || !near(profiled.take_profit_price, 105.0) ||
            profiled.max_hold_days != 30) {
            return fail("profile levels should override RiskLimits");
        }

        RiskLimits atr_limits;
        atr_limits.stop_method = StopMethod::ATR_MULTIPLE;
        RiskManager atr(atr_limits, 0.0);
        PriceBar with_atr = b;
        with_atr.indicators[analytics::columns::kAtr] = 2.5;
        if (!near(atr.computeLevels(100.0, with_atr, nullptr).stop_loss_price, 95.0)) {
            return fail("ATR stop should be entry - 2 x ATR");
        }
        if (!near(atr.computeLevels(100.0, b, nullptr).stop_loss_price, 95.0)) {
            return fail("missing ATR should fall back to the fixed stop");
        }

        RiskLimits trail_limits;
        trail_limits.stop_method = StopMethod::TRAILING;
        RiskManager trailing(trail_limits, 0.0);
        if (!near(trailing.computeLevels(100.0, b, nullptr).stop_loss_price, 99.0)) {
            return fail("initial trailing stop should be entry x 0.99");
        }

        Position pos = openPosition("AAPL", 10.0, 100.0);
        pos.stop_loss_price = 99.0;
        if (trailing.trailingStop(pos)) {
            return fail("trailing stop should not move without a new high");
        }
        pos.highest_price = 110.0;
        auto raised = trailing.trailingStop(pos);
        if (!raised || !near(*raised, 108.9)) {
            return fail("trailing stop should follow the high");
        }
        if (fixed.trailingStop(pos)) {
            return fail("fixed stop method never trails");
        }
    }

    // ===== Protective exits =====
    {
        RiskManager risk(RiskLimits(), 0.0);
        Position pos = openPosition("AAPL", 10.0, 100.0);
        pos.stop_loss_price = 95.0;
        pos.take_profit_price = 120.0;
        pos.max_hold_days = 30;

        if (risk.checkExit(pos, bar(kMillisPerDay, 100, 105, 96, 101))) {
            return fail("no level touched should not exit");
        }

        auto stop = risk.checkExit(pos, bar(kMillisPerDay, 98, 99, 94, 96));
        if (!stop || stop->reason != ExitReason::STOP_LOSS || !near(stop->price, 95.0)) {
            return fail("stop should fill at the stop price");
        }
        auto gap_down = risk.checkExit(pos, bar(kMillisPerDay, 90, 91, 89, 90));
        if (!gap_down || !near(gap_down->price, 90.0)) {
            return fail("gap through the stop should fill at the open");
        }

        auto target = risk.checkExit(pos, bar(kMillisPerDay, 110, 121, 109, 118));
        if (!target || target->reason != ExitReason::TAKE_PROFIT || !near(target->price, 120.0)) {
            return fail("take profit should fill at the target");
        }
        auto gap_up = risk.checkExit(pos, bar(kMillisPerDay, 125, 126, 124, 125));
        if (!gap_up || !near(gap_up->price, 125.0)) {
            return fail("gap through the target should fill at the open");
        }

        auto both = risk.checkExit(pos, bar(kMillisPerDay, 100, 121, 94, 100));
        if (!both || both->reason != ExitReason::STOP_LOSS) {
            return fail("stop loss takes precedence over take profit");
        }

        auto held = risk.checkExit(pos, bar(30 * kMillisPerDay, 100, 101, 99, 100.5));
        if (!held || held->reason != ExitReason::MAX_HOLD || !near(held->price, 100.5)) {
            return fail("max hold should exit at the close");
        }

        // The entry bar and older bars never trigger, even through the stop
        Position fresh = pos;
        fresh.opened_at = 5 * kMillisPerDay;
        if (risk.checkExit(fresh, bar(5 * kMillisPerDay, 98, 121, 80, 96)) ||
            risk.checkExit(fresh, bar(4 * kMillisPerDay, 98, 121, 80, 96))) {
            return fail("entry bar should not trigger a protective exit");
        }
        auto next_day = risk.checkExit(fresh, bar(6 * kMillisPerDay, 98, 99, 94, 96));
        if (!next_day || next_day->reason != ExitReason::STOP_LOSS) {
            return fail("first bar after entry should be checked");
        }

        RiskLimits trail_limits;
        trail_limits.stop_method = StopMethod::TRAILING;
        auto trailed = RiskManager(trail_limits, 0.0).checkExit(pos, bar(kMillisPerDay, 98, 99, 94, 96));
        if (!trailed || trailed->reason != ExitReason::TRAILING_STOP) {
            return fail("trailing method should report TRAILING_STOP");
        }
    }

    // ===== Limits validation =====
    {
        RiskLimits bad;
        bad.max_position_size_pct = 1.5;
        bool threw = false;
        try {
            bad.validate();
        } catch (const ConfigError&) {
            threw = true;
        }
        if (!threw) {
            return fail("max_position_size_pct above 1 should be rejected");
        }
        if (stopMethodFromString("trailing") != StopMethod::TRAILING || stopMethodFromString("bogus")) {
            return fail("stop method parsing mismatch");
        }
    }

    std::cout << "[TEST] RiskManager PASSED\n";
    return 0;
}
