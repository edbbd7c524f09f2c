#include "strategy/StrategyManager.h"
#include "strategy/MacdStrategy.h"
#include "strategy/RsiStrategy.h"
#include "strategy/MovingAverageStrategy.h"
#include "strategy/BollingerBandsStrategy.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace stocktrade {
namespace strategy {

std::unique_ptr<IStrategy> makeStrategy(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::MACD:
            return std::make_unique<MacdStrategy>();
        case StrategyKind::RSI:
            return std::make_unique<RsiStrategy>();
        case StrategyKind::MOVING_AVERAGE:
            return std::make_unique<MovingAverageStrategy>();
        case StrategyKind::BOLLINGER_BANDS:
            return std::make_unique<BollingerBandsStrategy>();
    }
    throw ConfigError("unsupported strategy kind");
}

StrategyManager::StrategyManager(StrategyKind kind, StrategyProfile profile)
    : strategy_(makeStrategy(kind))
    , profile_(std::move(profile))
{}

std::optional<Signal> StrategyManager::evaluate(
    const std::string& symbol,
    const std::vector<PriceBar>& window
) const {
    try {
        return strategy_->generateSignal(symbol, window, profile_);
    } catch (const InsufficientDataError& e) {
        LOG_DEBUG("[{}] {} no signal: {}", strategy_->id(), symbol, e.what());
    } catch (const MissingIndicatorError& e) {
        LOG_DEBUG("[{}] {} no signal: {}", strategy_->id(), symbol, e.what());
    }
    return std::nullopt;
}

} // namespace strategy
} // namespace stocktrade
