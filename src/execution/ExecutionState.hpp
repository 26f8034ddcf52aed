#pragma once

#include <string>

namespace flowrelay {
namespace execution {

/**
 * State of the single job the relay manages
 *
 * idle --submit--> queued --execution_start--> running --execution_success--> completed
 * queued|running --execution_interrupted--> interrupted
 * any --execution_error / upstream loss--> errored
 * completed|errored|interrupted --submit--> queued
 */
enum class ExecutionState {
    Idle,
    Queued,
    Running,
    Completed,
    Errored,
    Interrupted
};

std::string toString(ExecutionState state);

/// completed, errored or interrupted
bool isTerminal(ExecutionState state);

/// queued or running
bool isInFlight(ExecutionState state);

} // namespace execution
} // namespace flowrelay
