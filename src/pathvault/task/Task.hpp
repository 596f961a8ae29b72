#pragma once
#include "TaskState.hpp"
#include "log/TaggedLogger.hpp"

#include <atomic>
#include <functional>
#include <memory>

namespace PV {

/**
 * Task — one unit of work handed to an Executor
 *
 * Lifecycle: NotStarted -> Starting (accepted by an executor) -> Running ->
 * Completed | Failed. Every transition is a compare-and-swap, so a task is
 * accepted at most once and reaches exactly one terminal state.
 */
struct Task {
    template <typename FunctionType>
    static auto Create(FunctionType&& fun) -> std::shared_ptr<Task> {
        pv_log("Task::Create", "Function Called");
        auto task      = std::shared_ptr<Task>(new Task{});
        task->function = std::forward<FunctionType>(fun);
        return task;
    }

    // Runs once the task reaches a terminal state on a worker, whether the
    // function returned or threw.
    template <typename FunctionType>
    auto onFinished(FunctionType&& fun) -> Task& {
        this->finished = std::forward<FunctionType>(fun);
        return *this;
    }

    auto state() const -> TaskState;
    auto isCompleted() const -> bool;
    auto isFailed() const -> bool;
    auto isTerminal() const -> bool;
    auto hasStarted() const -> bool;

    auto tryStart() -> bool;            // NotStarted -> Starting
    auto transitionToRunning() -> bool; // Starting -> Running
    auto markCompleted() -> bool;       // Running -> Completed
    auto markFailed() -> bool;          // any non-terminal state -> Failed

private:
    friend class TaskPool;

    Task()                       = default; // Use Create()
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    auto transition(TaskState from, TaskState to) -> bool;

    std::atomic<TaskState>          current{TaskState::NotStarted};
    std::function<void(Task& task)> function;
    std::function<void(Task& task)> finished;
};

} // namespace PV
