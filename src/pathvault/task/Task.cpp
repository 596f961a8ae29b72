#include "task/Task.hpp"

namespace PV {

auto Task::transition(TaskState from, TaskState to) -> bool {
    return this->current.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

auto Task::state() const -> TaskState {
    return this->current.load(std::memory_order_acquire);
}

auto Task::isCompleted() const -> bool {
    return this->state() == TaskState::Completed;
}

auto Task::isFailed() const -> bool {
    return this->state() == TaskState::Failed;
}

auto Task::isTerminal() const -> bool {
    auto const now = this->state();
    return now == TaskState::Completed || now == TaskState::Failed;
}

auto Task::hasStarted() const -> bool {
    return this->state() != TaskState::NotStarted;
}

auto Task::tryStart() -> bool {
    return this->transition(TaskState::NotStarted, TaskState::Starting);
}

auto Task::transitionToRunning() -> bool {
    return this->transition(TaskState::Starting, TaskState::Running);
}

auto Task::markCompleted() -> bool {
    return this->transition(TaskState::Running, TaskState::Completed);
}

auto Task::markFailed() -> bool {
    auto observed = this->state();
    while (observed != TaskState::Completed && observed != TaskState::Failed) {
        if (this->current.compare_exchange_weak(observed, TaskState::Failed, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

} // namespace PV
