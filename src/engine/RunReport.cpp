#include "engine/RunReport.h"
#include "common/TypesJson.h"

namespace stocktrade {
namespace engine {

namespace {
nlohmann::json rejectedJson(const std::vector<RejectedSignal>& rejected) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : rejected) {
        out.push_back({{"symbol", r.symbol}, {"at", r.at}, {"code", r.code}, {"reason", r.reason}});
    }
    return out;
}

nlohmann::json errorsJson(const std::vector<SymbolError>& errors) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : errors) {
        out.push_back({{"symbol", e.symbol}, {"at", e.at}, {"message", e.message}});
    }
    return out;
}
}

nlohmann::json CycleResult::toJson() const {
    nlohmann::json j;
    j["at"] = at;
    j["analysis_count"] = analysis_count;
    j["signals_generated"] = signals_generated;
    j["trades_executed"] = trades_executed;
    j["errors"] = errors;
    j["stale_symbols"] = stale_symbols;
    j["skipped"] = skipped;
    if (skipped) {
        j["skip_reason"] = skip_reason;
    }
    j["closed_trades"] = closed_trades;
    j["rejected_signals"] = rejectedJson(rejected_signals);
    j["symbol_errors"] = errorsJson(symbol_errors);
    return j;
}

nlohmann::json RunReport::toJson() const {
    nlohmann::json j;
    j["trades"] = trades;

    nlohmann::json curve = nlohmann::json::array();
    for (const auto& point : equity_curve) {
        curve.push_back(nlohmann::json::array({point.timestamp, point.total_value}));
    }
    j["equity_curve"] = curve;
    j["performance"] = performance.toJson();
    j["rejected_signals"] = rejectedJson(rejected_signals);

    j["summary"] = {
        {"strategy", strategy_id},
        {"profile", profile_id},
        {"initial_capital", initial_capital},
        {"final_value", final_value},
        {"bars_processed", bars_processed},
        {"signals_generated", signals_generated},
        {"cancelled", cancelled},
        {"symbol_errors", errorsJson(symbol_errors)}
    };
    return j;
}

} // namespace engine
} // namespace stocktrade
