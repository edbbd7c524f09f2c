#include "common/Config.h"
#include "common/Errors.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

using namespace stocktrade;
using json = nlohmann::json;

namespace {
int fail(const std::string& message) {
    std::cerr << "[TEST] " << message << "\n";
    return 1;
}

json baseConfig() {
    return json::parse(R"({
        "run": {
            "symbols": ["AAPL", " msft "],
            "start": "2023-01-01",
            "end": 1703980800000,
            "initial_capital": 250000,
            "strategy": "MACD",
            "profile": "aggressive"
        },
        "risk": {
            "max_positions": 5,
            "stop_method": "atr",
            "atr_multiplier": 2.5,
            "safe_cash_floor": 20000
        },
        "broker": { "commission_pct": 0.001 },
        "automation": { "market_hours_only": false, "lookback_days": 90 },
        "logging": { "level": "DEBUG" }
    })");
}

// Returns the ConfigError message, or empty when parse succeeded
std::string parseError(const json& j) {
    try {
        ConfigLoader::parse(j);
    } catch (const ConfigError& e) {
        return e.what();
    }
    return "";
}

bool rejects(const std::function<void(json&)>& mutate, const std::string& expected_fragment) {
    json j = baseConfig();
    mutate(j);
    const std::string message = parseError(j);
    if (message.find(expected_fragment) == std::string::npos) {
        std::cerr << "[TEST] expected '" << expected_fragment << "', got '" << message << "'\n";
        return false;
    }
    return true;
}
}

int main() {
    // ===== Valid configuration =====
    {
        AppConfig cfg = ConfigLoader::parse(baseConfig());
        if (cfg.run.symbols.size() != 2 || cfg.run.symbols[1] != "msft") {
            return fail("symbols should be read and trimmed");
        }
        if (cfg.run.start_ms != 19358LL * kMillisPerDay || cfg.run.end_ms != 1703980800000LL) {
            return fail("start / end should accept dates and epoch milliseconds");
        }
        if (cfg.run.initial_capital != 250000.0 || cfg.run.strategy_kind != strategy::StrategyKind::MACD) {
            return fail("run section mismatch");
        }
        if (cfg.run.profile.name != "aggressive" || cfg.run.profile.max_hold_days != 7) {
            return fail("selected profile should come from the catalog");
        }
        if (cfg.run.risk_limits.max_positions != 5 || cfg.run.risk_limits.stop_method != risk::StopMethod::ATR_MULTIPLE ||
            cfg.run.risk_limits.atr_multiplier != 2.5 || cfg.run.risk_limits.safe_cash_floor != 20000.0) {
            return fail("risk section mismatch");
        }
        // Untouched fields keep their defaults
        if (cfg.run.risk_limits.transaction_limit_pct != risk::RiskLimits().transaction_limit_pct) {
            return fail("missing risk keys should keep defaults");
        }
        if (std::abs(cfg.run.broker.commission_pct - 0.001) > 1e-12 || cfg.run.broker.slippage_pct != 0.0) {
            return fail("broker section mismatch");
        }
        if (cfg.run.automation.market_hours_only || cfg.run.automation.lookback_days != 90 ||
            cfg.run.automation.cycle_interval_seconds != 300) {
            return fail("automation section mismatch");
        }
        if (cfg.log_level != "debug" || cfg.data_dir != "data") {
            return fail("logging / defaults mismatch");
        }
        if (cfg.run.data_source || cfg.run.cancel_token) {
            return fail("parse must not wire runtime collaborators");
        }
    }

    // Profile overrides and new profiles
    {
        json j = baseConfig();
        j["run"]["strategy"] = "rsi";
        j["run"]["profile"] = "balanced";
        j["strategies"] = json::parse(R"({
            "rsi": { "balanced": { "entry_threshold": 0.5, "rsi_range": [25, 75] } },
            "macd": { "scalp": { "entry_weights": { "macd_crossover_up": 1.0 }, "entry_threshold": 0.5 } }
        })");
        AppConfig cfg = ConfigLoader::parse(j);
        if (cfg.run.strategy_kind != strategy::StrategyKind::RSI ||
            cfg.run.profile.entry_threshold != 0.5 || cfg.run.profile.rsi_low != 25.0 ||
            cfg.run.profile.weight("rsi_cross_up") != 0.4) {
            return fail("override should merge into the builtin profile");
        }
        if (!cfg.catalog.hasProfile(strategy::StrategyKind::MACD, "scalp")) {
            return fail("new profile should be added to the catalog");
        }
    }

    // ===== Invalid configurations =====
    if (!rejects([](json& j) { j["run"]["strategy"] = "momentum"; }, "unknown strategy") ||
        !rejects([](json& j) { j["run"]["profile"] = "yolo"; }, "unknown profile") ||
        !rejects([](json& j) { j["run"]["symbols"] = json::array(); }, "run.symbols") ||
        !rejects([](json& j) { j["run"]["symbols"] = {"AAPL", "AAPL"}; }, "duplicates") ||
        !rejects([](json& j) { j["run"]["initial_capital"] = 0; }, "initial_capital") ||
        !rejects([](json& j) { j["run"]["initial_capital"] = "lots"; }, "invalid value type") ||
        !rejects([](json& j) { j["run"]["start"] = "2024-01-01"; }, "after run.end") ||
        !rejects([](json& j) { j["run"]["start"] = "last tuesday"; }, "run.start") ||
        !rejects([](json& j) { j["risk"]["stop_method"] = "vibes"; }, "stop_method") ||
        !rejects([](json& j) { j["risk"]["max_position_size_pct"] = 1.5; }, "max_position_size_pct") ||
        !rejects([](json& j) { j["broker"]["slippage_pct"] = -0.01; }, "slippage") ||
        !rejects([](json& j) { j["automation"]["market_open_minute_utc"] = 1300; }, "market hours") ||
        !rejects([](json& j) { j["logging"]["level"] = "verbose"; }, "logging.level") ||
        !rejects([](json& j) {
            j["strategies"] = {{"rsi", {{"balanced", {{"rsi_range", {70, 30}}}}}}};
        }, "rsi_range") ||
        !rejects([](json& j) {
            j["strategies"] = {{"macd", {{"balanced", {{"entry_weights", {{"moon_phase", 1.0}}}}}}}};
        }, "unknown entry weight") ||
        !rejects([](json& j) {
            j["strategies"] = {{"macd", {{"fresh", {{"entry_threshold", 0.5}}}}}};
        }, "must define entry_weights")) {
        return fail("invalid configuration accepted");
    }
    if (parseError(json::array()).empty()) {
        return fail("non-object config should be rejected");
    }

    // ===== Loading from disk =====
    {
        const auto dir = std::filesystem::temp_directory_path() / "stocktrade_test_config";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        const auto good = dir / "config.json";
        {
            std::ofstream out(good);
            out << baseConfig().dump(2);
        }
        AppConfig cfg = ConfigLoader::load(good.string());
        if (cfg.run.symbols.size() != 2 || cfg.profile_id != "aggressive") {
            return fail("load should parse the file");
        }

        bool threw = false;
        try {
            ConfigLoader::load((dir / "missing.json").string());
        } catch (const ConfigError& e) {
            threw = std::string(e.what()).find("not found") != std::string::npos;
        }
        if (!threw) {
            return fail("missing file should be a ConfigError");
        }

        const auto broken = dir / "broken.json";
        {
            std::ofstream out(broken);
            out << "{ \"run\": [";
        }
        threw = false;
        try {
            ConfigLoader::load(broken.string());
        } catch (const ConfigError&) {
            threw = true;
        }
        if (!threw) {
            return fail("malformed JSON should be a ConfigError");
        }

        std::filesystem::remove_all(dir);
    }

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
