#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/RunContext.h"
#include "strategy/StrategyCatalog.h"

namespace stocktrade {

// Everything read from config.json. Built once, never modified afterwards.
// run.data_source and run.cancel_token are left empty; the caller wires them.
struct AppConfig {
    engine::RunContext run;
    std::string strategy_id = "macd";
    std::string profile_id = "balanced";

    std::string data_dir = "data";
    std::string state_file = "state/portfolio.json";
    std::string report_file = "backtest_report.json";

    std::string log_level = "info";
    std::string log_dir = "logs";

    strategy::StrategyCatalog catalog = strategy::StrategyCatalog::builtin();
};

class ConfigLoader {
public:
    // Throws ConfigError when the file is missing or unreadable, the JSON is
    // malformed, or any value fails validation.
    static AppConfig load(const std::string& config_path);

    static AppConfig parse(const nlohmann::json& j);
};

} // namespace stocktrade
