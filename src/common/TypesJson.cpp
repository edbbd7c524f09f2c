#include "common/TypesJson.h"

namespace stocktrade {

void to_json(nlohmann::json& j, const Position& pos) {
    j = nlohmann::json{
        {"symbol", pos.symbol},
        {"shares", pos.shares},
        {"average_entry_price", pos.average_entry_price},
        {"opened_at", pos.opened_at},
        {"stop_loss_price", pos.stop_loss_price},
        {"take_profit_price", pos.take_profit_price},
        {"strategy_id", pos.strategy_id},
        {"profile_id", pos.profile_id},
        {"current_price", pos.current_price},
        {"highest_price", pos.highest_price},
        {"unrealized_pnl", pos.unrealized_pnl},
        {"entry_fees", pos.entry_fees},
        {"max_hold_days", pos.max_hold_days}
    };
}

void from_json(const nlohmann::json& j, Position& pos) {
    pos.symbol = j.at("symbol").get<std::string>();
    pos.shares = j.at("shares").get<double>();
    pos.average_entry_price = j.at("average_entry_price").get<double>();
    pos.opened_at = j.value("opened_at", 0LL);
    pos.stop_loss_price = j.value("stop_loss_price", 0.0);
    pos.take_profit_price = j.value("take_profit_price", 0.0);
    pos.strategy_id = j.value("strategy_id", "");
    pos.profile_id = j.value("profile_id", "");
    pos.current_price = j.value("current_price", pos.average_entry_price);
    pos.highest_price = j.value("highest_price", pos.current_price);
    pos.unrealized_pnl = j.value("unrealized_pnl", 0.0);
    pos.entry_fees = j.value("entry_fees", 0.0);
    pos.max_hold_days = j.value("max_hold_days", 0);
}

void to_json(nlohmann::json& j, const Trade& trade) {
    j = nlohmann::json{
        {"symbol", trade.symbol},
        {"shares", trade.shares},
        {"entry_price", trade.entry_price},
        {"exit_price", trade.exit_price},
        {"entry_at", trade.entry_at},
        {"exit_at", trade.exit_at},
        {"pnl_dollars", trade.pnl_dollars},
        {"pnl_pct", trade.pnl_pct},
        {"fees", trade.fees},
        {"exit_reason", toString(trade.exit_reason)},
        {"strategy_id", trade.strategy_id}
    };
}

void from_json(const nlohmann::json& j, Trade& trade) {
    trade.symbol = j.at("symbol").get<std::string>();
    trade.shares = j.at("shares").get<double>();
    trade.entry_price = j.at("entry_price").get<double>();
    trade.exit_price = j.at("exit_price").get<double>();
    trade.entry_at = j.value("entry_at", 0LL);
    trade.exit_at = j.value("exit_at", 0LL);
    trade.pnl_dollars = j.value("pnl_dollars", 0.0);
    trade.pnl_pct = j.value("pnl_pct", 0.0);
    trade.fees = j.value("fees", 0.0);
    trade.exit_reason = exitReasonFromString(j.value("exit_reason", "SIGNAL_EXIT"))
                            .value_or(ExitReason::SIGNAL_EXIT);
    trade.strategy_id = j.value("strategy_id", "");
}

void to_json(nlohmann::json& j, const EquityPoint& point) {
    j = nlohmann::json{
        {"timestamp", point.timestamp},
        {"total_value", point.total_value},
        {"cash_balance", point.cash_balance}
    };
}

void from_json(const nlohmann::json& j, EquityPoint& point) {
    point.timestamp = j.at("timestamp").get<long long>();
    point.total_value = j.at("total_value").get<double>();
    point.cash_balance = j.value("cash_balance", 0.0);
}

void to_json(nlohmann::json& j, const PortfolioState& state) {
    nlohmann::json positions = nlohmann::json::array();
    for (const auto& [symbol, pos] : state.positions) {
        positions.push_back(pos);
    }
    j = nlohmann::json{
        {"cash_balance", state.cash_balance},
        {"positions", positions},
        {"equity_curve", state.equity_curve},
        {"last_bar_at", state.last_bar_at}
    };
}

void from_json(const nlohmann::json& j, PortfolioState& state) {
    state.cash_balance = j.at("cash_balance").get<double>();
    state.positions.clear();
    for (const auto& item : j.value("positions", nlohmann::json::array())) {
        Position pos = item.get<Position>();
        state.positions[pos.symbol] = pos;
    }
    state.equity_curve = j.value("equity_curve", std::vector<EquityPoint>{});
    state.last_bar_at = j.value("last_bar_at", std::map<std::string, TimestampMs>{});
}

} // namespace stocktrade
