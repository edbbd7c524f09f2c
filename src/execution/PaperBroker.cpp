#include "execution/PaperBroker.h"
#include "common/Errors.h"

namespace stocktrade {
namespace execution {

void BrokerSettings::validate() const {
    if (commission_pct < 0.0 || commission_pct >= 1.0) {
        throw ConfigError("broker.commission_pct must be within [0, 1)");
    }
    if (slippage_pct < 0.0 || slippage_pct >= 1.0) {
        throw ConfigError("broker.slippage_pct must be within [0, 1)");
    }
}

PaperBroker::PaperBroker(BrokerSettings settings)
    : settings_(settings)
{}

Amount PaperBroker::buyCost(Shares shares, Price price) const {
    return shares * price * (1.0 + settings_.costRate());
}

Fill PaperBroker::buy(Shares shares, Price price) const {
    Fill fill;
    fill.shares = shares;
    fill.price = price;
    fill.notional = shares * price;
    fill.fees = fill.notional * settings_.costRate();
    fill.cash_delta = -(fill.notional + fill.fees);
    return fill;
}

Fill PaperBroker::sell(Shares shares, Price price) const {
    Fill fill;
    fill.shares = shares;
    fill.price = price;
    fill.notional = shares * price;
    fill.fees = fill.notional * settings_.costRate();
    fill.cash_delta = fill.notional - fill.fees;
    return fill;
}

} // namespace execution
} // namespace stocktrade
