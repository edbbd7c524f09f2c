#include "strategy/StrategyConfig.h"

#include <algorithm>
#include <cctype>

namespace stocktrade {
namespace strategy {

namespace {
std::string normalizeStrategyId(std::string id) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    id.erase(id.begin(), std::find_if(id.begin(), id.end(), not_space));
    id.erase(std::find_if(id.rbegin(), id.rend(), not_space).base(), id.end());
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(id.begin(), id.end(), '-', '_');
    return id;
}
}

const char* toString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::MACD: return "macd";
        case StrategyKind::RSI: return "rsi";
        case StrategyKind::MOVING_AVERAGE: return "ma_crossover";
        case StrategyKind::BOLLINGER_BANDS: return "bollinger_bands";
    }
    return "unknown";
}

std::optional<StrategyKind> strategyKindFromString(const std::string& id) {
    const std::string name = normalizeStrategyId(id);
    if (name == "macd") {
        return StrategyKind::MACD;
    }
    if (name == "rsi") {
        return StrategyKind::RSI;
    }
    if (name == "ma_crossover" || name == "moving_average" || name == "ma") {
        return StrategyKind::MOVING_AVERAGE;
    }
    if (name == "bollinger_bands" || name == "bollinger" || name == "bb") {
        return StrategyKind::BOLLINGER_BANDS;
    }
    return std::nullopt;
}

} // namespace strategy
} // namespace stocktrade
