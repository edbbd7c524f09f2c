#include "engine/EngineState.h"

namespace stocktrade {
namespace engine {

const char* toString(EngineState state) {
    switch (state) {
        case EngineState::IDLE: return "IDLE";
        case EngineState::LOADING_DATA: return "LOADING_DATA";
        case EngineState::EVALUATING_STRATEGY: return "EVALUATING_STRATEGY";
        case EngineState::RISK_CHECK: return "RISK_CHECK";
        case EngineState::EXECUTING: return "EXECUTING";
        case EngineState::RECORDING: return "RECORDING";
        case EngineState::COMPLETE: return "COMPLETE";
    }
    return "UNKNOWN";
}

bool EngineStateMachine::canTransition(EngineState from, EngineState to) {
    if (from == to) {
        return true;
    }

    switch (from) {
        case EngineState::IDLE:
            return to == EngineState::LOADING_DATA;
        case EngineState::LOADING_DATA:
            // nothing loadable goes straight to recording / completion
            return to == EngineState::EVALUATING_STRATEGY ||
                   to == EngineState::RECORDING ||
                   to == EngineState::COMPLETE;
        case EngineState::EVALUATING_STRATEGY:
            // exits skip the risk check
            return to == EngineState::RISK_CHECK ||
                   to == EngineState::EXECUTING ||
                   to == EngineState::RECORDING;
        case EngineState::RISK_CHECK:
            return to == EngineState::EXECUTING ||
                   to == EngineState::RECORDING;
        case EngineState::EXECUTING:
            return to == EngineState::RISK_CHECK ||
                   to == EngineState::RECORDING;
        case EngineState::RECORDING:
            return to == EngineState::LOADING_DATA ||
                   to == EngineState::COMPLETE;
        case EngineState::COMPLETE:
            return to == EngineState::IDLE;
    }
    return false;
}

} // namespace engine
} // namespace stocktrade
