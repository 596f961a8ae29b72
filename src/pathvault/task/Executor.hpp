#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace PV {

struct Task;

/**
 * Executor — where a TaskGroup sends the units of a fan-out
 *
 * submit() answers std::nullopt once the task is queued; any Error means the
 * task will never run and its completion hook will never fire. Calls may come
 * from several threads at once, including while shutdown() is in progress.
 */
struct Executor {
    virtual ~Executor() = default;

    // Accepts a weak reference; the submitter owns the task's lifetime.
    virtual auto submit(std::weak_ptr<Task>&&) -> std::optional<Error> = 0;

    auto submit(std::shared_ptr<Task> const& task) -> std::optional<Error> {
        return submit(std::weak_ptr<Task>(task));
    }

    // Refuses new work, then waits for queued and running tasks to finish.
    virtual auto shutdown() -> void = 0;
    // Worker threads available.
    virtual auto size() const -> size_t = 0;
};

} // namespace PV
