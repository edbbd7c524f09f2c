#pragma once

#include "common/Types.h"

namespace stocktrade {
namespace execution {

struct BrokerSettings {
    double commission_pct = 0.0;
    double slippage_pct = 0.0;

    // commission + slippage as a fraction of notional
    double costRate() const { return commission_pct + slippage_pct; }

    // Throws ConfigError
    void validate() const;
};

struct Fill {
    Shares shares;
    Price price;
    Amount notional;
    Amount fees;
    Amount cash_delta;   // negative for buys

    Fill() : shares(0), price(0), notional(0), fees(0), cash_delta(0) {}
};

// Simulated fills at the given market price against a virtual balance.
// Never talks to an exchange.
class PaperBroker {
public:
    explicit PaperBroker(BrokerSettings settings = BrokerSettings());

    Fill buy(Shares shares, Price price) const;
    Fill sell(Shares shares, Price price) const;

    // Total debit of a buy: shares x price x (1 + commission + slippage)
    Amount buyCost(Shares shares, Price price) const;

    const BrokerSettings& settings() const { return settings_; }

private:
    BrokerSettings settings_;
};

} // namespace execution
} // namespace stocktrade
