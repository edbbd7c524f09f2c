#include "common/Config.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>

namespace stocktrade {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Accepts epoch milliseconds or "YYYY-MM-DD"
TimestampMs readTimestamp(const nlohmann::json& value, const std::string& key) {
    if (value.is_number_integer()) {
        return value.get<TimestampMs>();
    }
    if (value.is_string()) {
        auto parsed = backtest::DataHistory::parseTimestamp(value.get<std::string>());
        if (parsed) {
            return *parsed;
        }
    }
    throw ConfigError("run." + key + " must be epoch milliseconds or YYYY-MM-DD");
}

void readRun(const nlohmann::json& r, AppConfig& cfg) {
    if (!r.is_object()) {
        throw ConfigError("'run' must be an object");
    }
    if (r.contains("symbols")) {
        cfg.run.symbols.clear();
        for (const auto& s : r.at("symbols")) {
            std::string symbol = trimCopy(s.get<std::string>());
            if (symbol.empty()) {
                throw ConfigError("run.symbols contains an empty symbol");
            }
            cfg.run.symbols.push_back(symbol);
        }
    }
    if (r.contains("start")) {
        cfg.run.start_ms = readTimestamp(r.at("start"), "start");
    }
    if (r.contains("end")) {
        cfg.run.end_ms = readTimestamp(r.at("end"), "end");
    }
    cfg.run.initial_capital = r.value("initial_capital", cfg.run.initial_capital);
    cfg.run.risk_free_rate = r.value("risk_free_rate", cfg.run.risk_free_rate);
    cfg.strategy_id = toLowerCopy(trimCopy(r.value("strategy", cfg.strategy_id)));
    cfg.profile_id = toLowerCopy(trimCopy(r.value("profile", cfg.profile_id)));
    cfg.data_dir = r.value("data_dir", cfg.data_dir);
    cfg.state_file = r.value("state_file", cfg.state_file);
    cfg.report_file = r.value("report_file", cfg.report_file);
}

void readRisk(const nlohmann::json& r, risk::RiskLimits& limits) {
    if (!r.is_object()) {
        throw ConfigError("'risk' must be an object");
    }
    limits.max_position_size_pct = r.value("max_position_size_pct", limits.max_position_size_pct);
    limits.transaction_limit_pct = r.value("transaction_limit_pct", limits.transaction_limit_pct);
    limits.max_positions = r.value("max_positions", limits.max_positions);
    limits.stop_loss_pct = r.value("stop_loss_pct", limits.stop_loss_pct);
    limits.take_profit_pct = r.value("take_profit_pct", limits.take_profit_pct);
    limits.safe_cash_floor = r.value("safe_cash_floor", limits.safe_cash_floor);
    limits.atr_multiplier = r.value("atr_multiplier", limits.atr_multiplier);
    limits.trailing_stop_pct = r.value("trailing_stop_pct", limits.trailing_stop_pct);
    limits.allow_fractional_shares = r.value("allow_fractional_shares", limits.allow_fractional_shares);

    if (r.contains("stop_method")) {
        const std::string method = r.at("stop_method").get<std::string>();
        auto parsed = risk::stopMethodFromString(method);
        if (!parsed) {
            throw ConfigError("risk.stop_method '" + method + "' (expected fixed, atr or trailing)");
        }
        limits.stop_method = *parsed;
    }
}

void readAutomation(const nlohmann::json& a, engine::AutomationSettings& settings) {
    if (!a.is_object()) {
        throw ConfigError("'automation' must be an object");
    }
    settings.cycle_interval_seconds = a.value("cycle_interval_seconds", settings.cycle_interval_seconds);
    settings.market_hours_only = a.value("market_hours_only", settings.market_hours_only);
    settings.market_open_minute_utc = a.value("market_open_minute_utc", settings.market_open_minute_utc);
    settings.market_close_minute_utc = a.value("market_close_minute_utc", settings.market_close_minute_utc);
    settings.lookback_days = a.value("lookback_days", settings.lookback_days);
}

void validateAutomation(const engine::AutomationSettings& a) {
    if (a.cycle_interval_seconds <= 0) {
        throw ConfigError("automation.cycle_interval_seconds must be positive");
    }
    if (a.market_open_minute_utc < 0 || a.market_close_minute_utc > 24 * 60 ||
        a.market_open_minute_utc >= a.market_close_minute_utc) {
        throw ConfigError("automation market hours must satisfy 0 <= open < close <= 1440");
    }
    if (a.lookback_days <= 0) {
        throw ConfigError("automation.lookback_days must be positive");
    }
}
}

AppConfig ConfigLoader::load(const std::string& path) {
    std::filesystem::path config_path(path);
    if (!config_path.is_absolute()) {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    if (!std::filesystem::exists(config_path)) {
        throw ConfigError("file not found: " + config_path.string());
    }
    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(config_path.string() + ": " + e.what());
    }
    return parse(j);
}

AppConfig ConfigLoader::parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("top level must be an object");
    }

    AppConfig cfg;
    try {
        if (j.contains("run")) {
            readRun(j.at("run"), cfg);
        }
        if (j.contains("risk")) {
            readRisk(j.at("risk"), cfg.run.risk_limits);
        }
        if (j.contains("broker")) {
            const auto& b = j.at("broker");
            cfg.run.broker.commission_pct = b.value("commission_pct", cfg.run.broker.commission_pct);
            cfg.run.broker.slippage_pct = b.value("slippage_pct", cfg.run.broker.slippage_pct);
        }
        if (j.contains("performance")) {
            const auto& p = j.at("performance");
            cfg.run.performance.annualization_factor =
                p.value("annualization_factor", cfg.run.performance.annualization_factor);
            cfg.run.performance.sortino_target = p.value("sortino_target", cfg.run.performance.sortino_target);
            cfg.run.performance.omega_threshold = p.value("omega_threshold", cfg.run.performance.omega_threshold);
        }
        if (j.contains("automation")) {
            readAutomation(j.at("automation"), cfg.run.automation);
        }
        if (j.contains("logging")) {
            const auto& l = j.at("logging");
            cfg.log_level = toLowerCopy(l.value("level", cfg.log_level));
            cfg.log_dir = l.value("dir", cfg.log_dir);
        }
        if (j.contains("strategies")) {
            cfg.catalog.applyOverrides(j.at("strategies"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value type: ") + e.what());
    }

    // ===== Validation =====
    if (cfg.run.symbols.empty()) {
        throw ConfigError("run.symbols must list at least one symbol");
    }
    std::set<std::string> unique(cfg.run.symbols.begin(), cfg.run.symbols.end());
    if (unique.size() != cfg.run.symbols.size()) {
        throw ConfigError("run.symbols contains duplicates");
    }
    if (!(cfg.run.initial_capital > 0.0)) {
        throw ConfigError("run.initial_capital must be positive");
    }
    if (cfg.run.end_ms != 0 && cfg.run.start_ms > cfg.run.end_ms) {
        throw ConfigError("run.start is after run.end");
    }
    if (cfg.run.performance.annualization_factor <= 0.0) {
        throw ConfigError("performance.annualization_factor must be positive");
    }

    auto kind = strategy::strategyKindFromString(cfg.strategy_id);
    if (!kind) {
        throw ConfigError("unknown strategy '" + cfg.strategy_id + "'");
    }
    cfg.run.strategy_kind = *kind;
    cfg.run.profile = cfg.catalog.profile(*kind, cfg.profile_id);

    cfg.run.risk_limits.validate();
    cfg.run.broker.validate();
    validateAutomation(cfg.run.automation);

    static const std::set<std::string> kLevels = {"debug", "info", "warn", "error"};
    if (kLevels.count(cfg.log_level) == 0) {
        throw ConfigError("logging.level '" + cfg.log_level + "' (expected debug, info, warn or error)");
    }
    return cfg;
}

} // namespace stocktrade
