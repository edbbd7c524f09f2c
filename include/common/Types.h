#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stocktrade {

// Epoch milliseconds (UTC)
using TimestampMs = long long;
using Price = double;
using Shares = double;
using Amount = double;

constexpr long long kMillisPerDay = 86400000LL;

struct PriceBar {
    std::string symbol;
    TimestampMs timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;
    // Indicator columns keyed by feed column name (e.g. "rsi_14", "bb_lower_20_2.0")
    std::map<std::string, double> indicators;

    PriceBar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    PriceBar(std::string s, TimestampMs t, double o, double h, double l, double c, double v)
        : symbol(std::move(s)), timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}

    std::optional<double> indicator(const std::string& name) const {
        auto it = indicators.find(name);
        if (it == indicators.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

enum class ExitReason {
    SIGNAL_EXIT,
    STOP_LOSS,
    TAKE_PROFIT,
    TRAILING_STOP,
    MAX_HOLD,
    END_OF_BACKTEST
};

struct Position {
    std::string symbol;
    Shares shares;
    Price average_entry_price;
    TimestampMs opened_at;
    Price stop_loss_price;
    Price take_profit_price;
    std::string strategy_id;
    std::string profile_id;

    Price current_price;
    Price highest_price;
    Amount unrealized_pnl;
    Amount entry_fees;
    int max_hold_days;

    Position()
        : shares(0), average_entry_price(0), opened_at(0),
          stop_loss_price(0), take_profit_price(0),
          current_price(0), highest_price(0), unrealized_pnl(0),
          entry_fees(0), max_hold_days(0) {}

    Amount marketValue() const { return shares * current_price; }
};

struct Trade {
    std::string symbol;
    Shares shares;
    Price entry_price;
    Price exit_price;
    TimestampMs entry_at;
    TimestampMs exit_at;
    Amount pnl_dollars;
    double pnl_pct;
    Amount fees;
    ExitReason exit_reason;
    std::string strategy_id;

    Trade()
        : shares(0), entry_price(0), exit_price(0), entry_at(0), exit_at(0),
          pnl_dollars(0), pnl_pct(0), fees(0), exit_reason(ExitReason::SIGNAL_EXIT) {}

    double holdDays() const {
        return static_cast<double>(exit_at - entry_at) / static_cast<double>(kMillisPerDay);
    }
};

struct EquityPoint {
    TimestampMs timestamp;
    Amount total_value;
    Amount cash_balance;

    EquityPoint() : timestamp(0), total_value(0), cash_balance(0) {}
    EquityPoint(TimestampMs t, Amount total, Amount cash)
        : timestamp(t), total_value(total), cash_balance(cash) {}
};

struct PortfolioState {
    Amount cash_balance = 0.0;
    std::map<std::string, Position> positions;
    std::vector<EquityPoint> equity_curve;
    // Timestamp of the newest bar already processed, per symbol
    std::map<std::string, TimestampMs> last_bar_at;

    Amount positionsValue() const {
        Amount value = 0.0;
        for (const auto& [symbol, pos] : positions) {
            value += pos.marketValue();
        }
        return value;
    }

    Amount totalValue() const { return cash_balance + positionsValue(); }

    bool hasPosition(const std::string& symbol) const {
        return positions.find(symbol) != positions.end();
    }
};

const char* toString(ExitReason reason);
std::optional<ExitReason> exitReasonFromString(const std::string& value);

} // namespace stocktrade
