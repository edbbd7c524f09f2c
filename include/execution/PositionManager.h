#pragma once

#include "common/Types.h"
#include "execution/PaperBroker.h"
#include "risk/RiskManager.h"
#include "strategy/IStrategy.h"
#include <optional>
#include <string>
#include <vector>

namespace stocktrade {
namespace execution {

// Owns the authoritative PortfolioState and the closed-trade ledger.
// Strategy and RiskManager only see it through state().
class PositionManager {
public:
    PositionManager(Amount initial_cash, PaperBroker broker);
    // Resume from a saved snapshot
    PositionManager(PortfolioState state, PaperBroker broker, std::vector<Trade> trades = {});

    // ===== Position lifecycle =====

    // Debits cash and creates the position, or throws and changes nothing:
    // SymbolAlreadyOpenError, InsufficientCashError, std::invalid_argument
    // for non-positive shares or price.
    const Position& openPosition(const strategy::Signal& signal,
                                 Shares shares,
                                 Price price,
                                 TimestampMs at,
                                 const risk::RiskLevels& levels);

    // Credits cash, removes the position and appends a Trade.
    // Throws PositionNotFoundError.
    Trade closePosition(const std::string& symbol, Price price, TimestampMs at, ExitReason reason);

    // Price update without cash movement; tracks highest price and unrealized P&L.
    void markToMarket(const std::string& symbol, Price price);

    // Raises the stop; a lower value is ignored.
    void raiseStopLoss(const std::string& symbol, Price new_stop);

    // Appends (at, cash + sum(shares x current_price)) to the equity curve.
    const EquityPoint& recordEquity(TimestampMs at);

    // Remembers the newest bar seen for a symbol; older timestamps are ignored.
    void markBarProcessed(const std::string& symbol, TimestampMs bar_at);
    std::optional<TimestampMs> lastBarAt(const std::string& symbol) const;

    // ===== Queries =====
    const PortfolioState& state() const { return state_; }
    const std::vector<Trade>& trades() const { return trades_; }
    bool hasPosition(const std::string& symbol) const { return state_.hasPosition(symbol); }
    const Position& position(const std::string& symbol) const;
    std::vector<std::string> openSymbols() const;
    Amount cash() const { return state_.cash_balance; }
    Amount totalValue() const { return state_.totalValue(); }

private:
    Position& mutablePosition(const std::string& symbol);

    PortfolioState state_;
    PaperBroker broker_;
    std::vector<Trade> trades_;
};

} // namespace execution
} // namespace stocktrade
