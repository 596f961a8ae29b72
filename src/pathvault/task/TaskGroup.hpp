#pragma once
#include "Executor.hpp"
#include "Task.hpp"
#include "core/Error.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace PV {

/**
 * TaskGroup — bounded fan-out / fan-in over an Executor
 *
 * dispatch() blocks while maxInFlight units are outstanding, then hands the
 * unit to the executor. wait() blocks until every dispatched unit reached a
 * terminal state. A unit reports failure by returning an Error; a unit that
 * throws is recorded as UnknownError. Units refused by the executor never run
 * and are recorded with the executor's error.
 *
 * The destructor waits, so units may safely capture state owned by the
 * caller's stack frame.
 */
class TaskGroup {
public:
    using Unit = std::function<std::optional<Error>()>;

    TaskGroup(Executor& executor, std::size_t maxInFlight);
    ~TaskGroup();

    TaskGroup(TaskGroup const&)                    = delete;
    auto operator=(TaskGroup const&) -> TaskGroup& = delete;

    // Returns the refusal error when the executor would not take the unit.
    auto dispatch(Unit unit) -> std::optional<Error>;
    auto wait() -> void;

    // Records a failure for a unit that was never dispatched.
    auto recordSkipped(Error error) -> void;

    auto errors() const -> std::vector<Error>;
    auto dispatchedCount() const -> std::size_t;
    auto finishedCount() const -> std::size_t;

private:
    auto record(Error error) -> void;
    auto release() -> void;

    Executor&                          executor;
    std::size_t const                  maxInFlight;
    mutable std::mutex                 mutex;
    std::condition_variable            cv;
    std::size_t                        inFlight   = 0;
    std::size_t                        dispatched = 0;
    std::size_t                        finished   = 0;
    std::vector<std::shared_ptr<Task>> tasks;
    std::vector<Error>                 failures;
};

} // namespace PV
