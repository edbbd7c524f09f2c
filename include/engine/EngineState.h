#pragma once

namespace stocktrade {
namespace engine {

enum class EngineState {
    IDLE,
    LOADING_DATA,
    EVALUATING_STRATEGY,
    RISK_CHECK,
    EXECUTING,
    RECORDING,
    COMPLETE
};

const char* toString(EngineState state);

class EngineStateMachine {
public:
    // Same-state "transitions" are allowed and mean no change.
    static bool canTransition(EngineState from, EngineState to);
};

} // namespace engine
} // namespace stocktrade
