#pragma once
#include <string_view>

namespace PV {

enum class TaskState {
    NotStarted, // Created, not yet accepted by an executor
    Starting,   // Accepted and queued
    Running,    // Executing on a worker
    Completed,  // Finished without throwing
    Failed      // Threw, or was refused by the executor
};

constexpr std::string_view taskStateToString(TaskState state) {
    switch (state) {
        case TaskState::NotStarted:
            return "NotStarted";
        case TaskState::Starting:
            return "Starting";
        case TaskState::Running:
            return "Running";
        case TaskState::Completed:
            return "Completed";
        case TaskState::Failed:
            return "Failed";
    }
    return "Unknown";
}

} // namespace PV
