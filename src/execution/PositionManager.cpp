#include "execution/PositionManager.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace stocktrade {
namespace execution {

PositionManager::PositionManager(Amount initial_cash, PaperBroker broker)
    : broker_(std::move(broker))
{
    if (initial_cash < 0.0) {
        throw std::invalid_argument("initial cash must not be negative");
    }
    state_.cash_balance = initial_cash;
}

PositionManager::PositionManager(PortfolioState state, PaperBroker broker, std::vector<Trade> trades)
    : state_(std::move(state))
    , broker_(std::move(broker))
    , trades_(std::move(trades))
{
    if (state_.cash_balance < 0.0) {
        throw std::invalid_argument("saved cash balance is negative");
    }
}

const Position& PositionManager::openPosition(
    const strategy::Signal& signal,
    Shares shares,
    Price price,
    TimestampMs at,
    const risk::RiskLevels& levels
) {
    // Validate everything before touching state
    if (!(shares > 0.0) || !(price > 0.0)) {
        throw std::invalid_argument(fmt::format(
            "invalid order for {}: shares={} price={}", signal.symbol, shares, price));
    }
    if (state_.hasPosition(signal.symbol)) {
        throw SymbolAlreadyOpenError(signal.symbol);
    }

    const Amount cost = broker_.buyCost(shares, price);
    if (cost > state_.cash_balance) {
        throw InsufficientCashError(fmt::format(
            "buy {} x {} @ {:.2f} costs {:.2f}, cash {:.2f}",
            signal.symbol, shares, price, cost, state_.cash_balance));
    }
    const Fill fill = broker_.buy(shares, price);

    Position pos;
    pos.symbol = signal.symbol;
    pos.shares = shares;
    pos.average_entry_price = price;
    pos.opened_at = at;
    pos.stop_loss_price = levels.stop_loss_price;
    pos.take_profit_price = levels.take_profit_price;
    pos.max_hold_days = levels.max_hold_days;
    pos.strategy_id = signal.strategy_id;
    pos.profile_id = signal.profile_id;
    pos.current_price = price;
    pos.highest_price = price;
    pos.entry_fees = fill.fees;

    state_.cash_balance += fill.cash_delta;
    auto it = state_.positions.emplace(pos.symbol, pos).first;

    LOG_INFO("[Position] open {} {} @ {:.2f} (fees {:.2f}, SL {:.2f}, TP {:.2f}), cash {:.2f}",
             pos.symbol, shares, price, fill.fees,
             pos.stop_loss_price, pos.take_profit_price, state_.cash_balance);
    Logger::getInstance().logTrade(pos.symbol, "BUY", price, shares, 0.0);
    return it->second;
}

Trade PositionManager::closePosition(
    const std::string& symbol,
    Price price,
    TimestampMs at,
    ExitReason reason
) {
    auto it = state_.positions.find(symbol);
    if (it == state_.positions.end()) {
        throw PositionNotFoundError(symbol);
    }
    if (!(price > 0.0)) {
        throw std::invalid_argument(fmt::format("invalid exit price for {}: {}", symbol, price));
    }

    const Position& pos = it->second;
    const Fill fill = broker_.sell(pos.shares, price);

    Trade trade;
    trade.symbol = symbol;
    trade.shares = pos.shares;
    trade.entry_price = pos.average_entry_price;
    trade.exit_price = price;
    trade.entry_at = pos.opened_at;
    trade.exit_at = at;
    trade.fees = pos.entry_fees + fill.fees;
    trade.pnl_dollars = (price - pos.average_entry_price) * pos.shares - trade.fees;
    const Amount invested = pos.average_entry_price * pos.shares;
    trade.pnl_pct = (invested > 0.0) ? trade.pnl_dollars / invested : 0.0;
    trade.exit_reason = reason;
    trade.strategy_id = pos.strategy_id;

    state_.cash_balance += fill.cash_delta;
    state_.positions.erase(it);
    trades_.push_back(trade);

    LOG_INFO("[Position] close {} {} @ {:.2f} ({}), P&L {:.2f} ({:.2f}%), cash {:.2f}",
             symbol, trade.shares, price, toString(reason),
             trade.pnl_dollars, trade.pnl_pct * 100.0, state_.cash_balance);
    Logger::getInstance().logTrade(symbol, "SELL", price, trade.shares, trade.pnl_dollars);
    return trade;
}

void PositionManager::markToMarket(const std::string& symbol, Price price) {
    Position& pos = mutablePosition(symbol);
    pos.current_price = price;
    if (price > pos.highest_price) {
        pos.highest_price = price;
    }
    pos.unrealized_pnl = (price - pos.average_entry_price) * pos.shares;
}

void PositionManager::raiseStopLoss(const std::string& symbol, Price new_stop) {
    Position& pos = mutablePosition(symbol);
    if (new_stop <= pos.stop_loss_price) {
        return;
    }
    pos.stop_loss_price = new_stop;
}

const EquityPoint& PositionManager::recordEquity(TimestampMs at) {
    state_.equity_curve.emplace_back(at, state_.totalValue(), state_.cash_balance);
    return state_.equity_curve.back();
}

void PositionManager::markBarProcessed(const std::string& symbol, TimestampMs bar_at) {
    auto it = state_.last_bar_at.find(symbol);
    if (it == state_.last_bar_at.end()) {
        state_.last_bar_at.emplace(symbol, bar_at);
    } else if (bar_at > it->second) {
        it->second = bar_at;
    }
}

std::optional<TimestampMs> PositionManager::lastBarAt(const std::string& symbol) const {
    auto it = state_.last_bar_at.find(symbol);
    if (it == state_.last_bar_at.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Position& PositionManager::position(const std::string& symbol) const {
    auto it = state_.positions.find(symbol);
    if (it == state_.positions.end()) {
        throw PositionNotFoundError(symbol);
    }
    return it->second;
}

std::vector<std::string> PositionManager::openSymbols() const {
    std::vector<std::string> symbols;
    symbols.reserve(state_.positions.size());
    for (const auto& [symbol, pos] : state_.positions) {
        symbols.push_back(symbol);
    }
    return symbols;
}

Position& PositionManager::mutablePosition(const std::string& symbol) {
    auto it = state_.positions.find(symbol);
    if (it == state_.positions.end()) {
        throw PositionNotFoundError(symbol);
    }
    return it->second;
}

} // namespace execution
} // namespace stocktrade
