#include "strategy/StrategyCatalog.h"
#include "strategy/StrategyManager.h"
#include "common/Errors.h"

#include <algorithm>

namespace stocktrade {
namespace strategy {

namespace {
StrategyProfile makeProfile(const std::string& name,
                            std::map<std::string, double> weights,
                            double threshold,
                            double rsi_low, double rsi_high,
                            double take_profit_pct, double stop_loss_pct,
                            int max_hold_days) {
    StrategyProfile p;
    p.name = name;
    p.entry_weights = std::move(weights);
    p.entry_threshold = threshold;
    p.rsi_low = rsi_low;
    p.rsi_high = rsi_high;
    p.take_profit_pct = take_profit_pct;
    p.stop_loss_pct = stop_loss_pct;
    p.max_hold_days = max_hold_days;
    return p;
}

void readProfileFields(const nlohmann::json& j, StrategyProfile& p) {
    if (j.contains("entry_weights")) {
        const auto& w = j.at("entry_weights");
        if (!w.is_object()) {
            throw ConfigError("profile '" + p.name + "': entry_weights must be an object");
        }
        p.entry_weights.clear();
        for (auto it = w.begin(); it != w.end(); ++it) {
            p.entry_weights[it.key()] = it.value().get<double>();
        }
    }
    p.entry_threshold = j.value("entry_threshold", p.entry_threshold);
    if (j.contains("rsi_range")) {
        const auto& r = j.at("rsi_range");
        if (!r.is_array() || r.size() != 2) {
            throw ConfigError("profile '" + p.name + "': rsi_range must be [low, high]");
        }
        p.rsi_low = r[0].get<double>();
        p.rsi_high = r[1].get<double>();
    }
    p.stop_loss_pct = j.value("stop_loss_pct", p.stop_loss_pct);
    p.take_profit_pct = j.value("take_profit_pct", p.take_profit_pct);
    p.max_hold_days = j.value("max_hold_days", p.max_hold_days);
}
}

StrategyCatalog StrategyCatalog::builtin() {
    StrategyCatalog c;

    // ===== MACD =====
    auto macd = [](double cross, double rsi, double ema_s, double ema_l) {
        return std::map<std::string, double>{
            {"macd_crossover_up", cross}, {"rsi_neutral", rsi},
            {"price_above_ema_short", ema_s}, {"price_above_ema_long", ema_l}};
    };
    c.put(StrategyKind::MACD, makeProfile("balanced", macd(0.5, 0.3, 0.1, 0.1), 0.3, 40, 60, 0.05, 0.03, 30));
    c.put(StrategyKind::MACD, makeProfile("canonical", macd(0.6, 0.2, 0.1, 0.1), 0.4, 35, 65, 0.05, 0.03, 30));
    c.put(StrategyKind::MACD, makeProfile("aggressive", macd(0.7, 0.2, 0.05, 0.05), 0.2, 30, 70, 0.03, 0.02, 7));
    c.put(StrategyKind::MACD, makeProfile("conservative", macd(0.4, 0.4, 0.1, 0.1), 0.6, 45, 55, 0.10, 0.05, 60));

    // ===== RSI (rsi_range = oversold / overbought) =====
    auto rsi = [](double cross, double oversold, double volume, double trend) {
        return std::map<std::string, double>{
            {"rsi_cross_up", cross}, {"rsi_oversold", oversold},
            {"volume_confirmation", volume}, {"trend_filter", trend}};
    };
    c.put(StrategyKind::RSI, makeProfile("balanced", rsi(0.4, 0.3, 0.15, 0.15), 0.35, 30, 70, 0.05, 0.03, 30));
    c.put(StrategyKind::RSI, makeProfile("aggressive", rsi(0.5, 0.3, 0.1, 0.1), 0.2, 35, 65, 0.03, 0.02, 7));
    c.put(StrategyKind::RSI, makeProfile("conservative", rsi(0.4, 0.2, 0.2, 0.2), 0.6, 25, 75, 0.10, 0.05, 60));

    // ===== Moving average crossover =====
    auto ma = [](double cross, double above, double rsi_ok, double volume) {
        return std::map<std::string, double>{
            {"ma_crossover_up", cross}, {"price_above_mas", above},
            {"rsi_not_overbought", rsi_ok}, {"volume_confirmation", volume}};
    };
    c.put(StrategyKind::MOVING_AVERAGE, makeProfile("balanced", ma(0.5, 0.2, 0.15, 0.15), 0.45, 30, 70, 0.05, 0.03, 30));
    c.put(StrategyKind::MOVING_AVERAGE, makeProfile("aggressive", ma(0.6, 0.2, 0.1, 0.1), 0.25, 30, 75, 0.03, 0.02, 7));
    c.put(StrategyKind::MOVING_AVERAGE, makeProfile("conservative", ma(0.4, 0.2, 0.2, 0.2), 0.65, 30, 65, 0.10, 0.05, 60));

    // ===== Bollinger bands =====
    auto bb = [](double rebound, double near, double rsi_ok, double volume) {
        return std::map<std::string, double>{
            {"lower_band_rebound", rebound}, {"near_lower_band", near},
            {"rsi_not_overbought", rsi_ok}, {"volume_confirmation", volume}};
    };
    c.put(StrategyKind::BOLLINGER_BANDS, makeProfile("balanced", bb(0.4, 0.3, 0.15, 0.15), 0.4, 30, 70, 0.05, 0.03, 30));
    c.put(StrategyKind::BOLLINGER_BANDS, makeProfile("aggressive", bb(0.5, 0.3, 0.1, 0.1), 0.25, 30, 75, 0.03, 0.02, 7));
    c.put(StrategyKind::BOLLINGER_BANDS, makeProfile("conservative", bb(0.4, 0.2, 0.2, 0.2), 0.6, 30, 65, 0.10, 0.05, 60));

    return c;
}

void StrategyCatalog::applyOverrides(const nlohmann::json& strategies) {
    if (strategies.is_null()) {
        return;
    }
    if (!strategies.is_object()) {
        throw ConfigError("'strategies' must be an object");
    }

    for (auto s_it = strategies.begin(); s_it != strategies.end(); ++s_it) {
        auto kind = strategyKindFromString(s_it.key());
        if (!kind) {
            throw ConfigError("unknown strategy id '" + s_it.key() + "'");
        }
        if (!s_it.value().is_object()) {
            throw ConfigError("strategy '" + s_it.key() + "' must map profile names to objects");
        }

        for (auto p_it = s_it.value().begin(); p_it != s_it.value().end(); ++p_it) {
            if (!p_it.value().is_object()) {
                throw ConfigError("profile '" + p_it.key() + "' must be an object");
            }

            StrategyProfile p;
            const bool existing = hasProfile(*kind, p_it.key());
            if (existing) {
                p = profiles_[*kind][p_it.key()];
            } else if (!p_it.value().contains("entry_weights")) {
                throw ConfigError("new profile '" + p_it.key() + "' for " +
                                  toString(*kind) + " must define entry_weights");
            }
            p.name = p_it.key();

            try {
                readProfileFields(p_it.value(), p);
            } catch (const nlohmann::json::exception& e) {
                throw ConfigError("profile '" + p.name + "' for " + toString(*kind) + ": " + e.what());
            }
            put(*kind, p);
        }
    }
}

const StrategyProfile& StrategyCatalog::profile(StrategyKind kind, const std::string& name) const {
    auto k_it = profiles_.find(kind);
    if (k_it != profiles_.end()) {
        auto p_it = k_it->second.find(name);
        if (p_it != k_it->second.end()) {
            return p_it->second;
        }
    }
    throw ConfigError("unknown profile '" + name + "' for strategy " + toString(kind));
}

bool StrategyCatalog::hasProfile(StrategyKind kind, const std::string& name) const {
    auto k_it = profiles_.find(kind);
    return k_it != profiles_.end() && k_it->second.count(name) > 0;
}

std::vector<std::string> StrategyCatalog::profileNames(StrategyKind kind) const {
    std::vector<std::string> names;
    auto k_it = profiles_.find(kind);
    if (k_it == profiles_.end()) {
        return names;
    }
    for (const auto& [name, p] : k_it->second) {
        names.push_back(name);
    }
    return names;
}

void StrategyCatalog::put(StrategyKind kind, const StrategyProfile& profile) {
    validate(kind, profile);
    profiles_[kind][profile.name] = profile;
}

void StrategyCatalog::validate(StrategyKind kind, const StrategyProfile& p) {
    const std::string where = std::string(toString(kind)) + "/" + p.name;
    if (p.name.empty()) {
        throw ConfigError(where + ": profile name is empty");
    }

    const auto allowed = makeStrategy(kind)->conditionNames();
    for (const auto& [condition, weight] : p.entry_weights) {
        if (std::find(allowed.begin(), allowed.end(), condition) == allowed.end()) {
            throw ConfigError(where + ": unknown entry weight '" + condition + "'");
        }
        if (weight < 0.0) {
            throw ConfigError(where + ": negative weight for '" + condition + "'");
        }
    }
    if (p.totalWeight() <= 0.0) {
        throw ConfigError(where + ": entry weights sum to zero");
    }
    if (p.entry_threshold < 0.0 || p.entry_threshold > 1.0) {
        throw ConfigError(where + ": entry_threshold must be within [0, 1]");
    }
    if (p.rsi_low < 0.0 || p.rsi_high > 100.0 || p.rsi_low >= p.rsi_high) {
        throw ConfigError(where + ": rsi_range must satisfy 0 <= low < high <= 100");
    }
    if (p.stop_loss_pct < 0.0 || p.stop_loss_pct >= 1.0) {
        throw ConfigError(where + ": stop_loss_pct must be within [0, 1)");
    }
    if (p.take_profit_pct < 0.0) {
        throw ConfigError(where + ": take_profit_pct must not be negative");
    }
    if (p.max_hold_days < 0) {
        throw ConfigError(where + ": max_hold_days must not be negative");
    }
}

} // namespace strategy
} // namespace stocktrade
