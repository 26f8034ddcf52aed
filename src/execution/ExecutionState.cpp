#include "execution/ExecutionState.hpp"

namespace flowrelay {
namespace execution {

std::string toString(ExecutionState state) {
    switch (state) {
        case ExecutionState::Idle:        return "idle";
        case ExecutionState::Queued:      return "queued";
        case ExecutionState::Running:     return "running";
        case ExecutionState::Completed:   return "completed";
        case ExecutionState::Errored:     return "errored";
        case ExecutionState::Interrupted: return "interrupted";
    }
    return "unknown";
}

bool isTerminal(ExecutionState state) {
    return state == ExecutionState::Completed ||
           state == ExecutionState::Errored ||
           state == ExecutionState::Interrupted;
}

bool isInFlight(ExecutionState state) {
    return state == ExecutionState::Queued || state == ExecutionState::Running;
}

} // namespace execution
} // namespace flowrelay
