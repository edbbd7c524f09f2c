#include "common/Types.h"

namespace stocktrade {

const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::SIGNAL_EXIT: return "SIGNAL_EXIT";
        case ExitReason::STOP_LOSS: return "STOP_LOSS";
        case ExitReason::TAKE_PROFIT: return "TAKE_PROFIT";
        case ExitReason::TRAILING_STOP: return "TRAILING_STOP";
        case ExitReason::MAX_HOLD: return "MAX_HOLD";
        case ExitReason::END_OF_BACKTEST: return "END_OF_BACKTEST";
    }
    return "UNKNOWN";
}

std::optional<ExitReason> exitReasonFromString(const std::string& value) {
    if (value == "SIGNAL_EXIT") return ExitReason::SIGNAL_EXIT;
    if (value == "STOP_LOSS") return ExitReason::STOP_LOSS;
    if (value == "TAKE_PROFIT") return ExitReason::TAKE_PROFIT;
    if (value == "TRAILING_STOP") return ExitReason::TRAILING_STOP;
    if (value == "MAX_HOLD") return ExitReason::MAX_HOLD;
    if (value == "END_OF_BACKTEST") return ExitReason::END_OF_BACKTEST;
    return std::nullopt;
}

} // namespace stocktrade
