#pragma once
#include "Executor.hpp"
#include "Task.hpp"
#include "core/Error.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace PV {

/**
 * TaskPool — fixed set of jthread workers pulling from one FIFO queue
 *
 * The pool is owned by whoever builds the VfsContext; there is no global
 * instance. submit() refuses tasks once shutdown() has begun, and shutdown()
 * lets the workers drain whatever is already queued before joining them, so a
 * TaskGroup waiting on queued units is never left hanging.
 */
class TaskPool : public Executor {
public:
    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(std::weak_ptr<Task>&& task) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> size_t override;

private:
    auto workerLoop() -> void;
    auto run(Task& task) -> void;
    auto joinWorkers() -> void;

    std::vector<std::jthread>       workers;
    std::queue<std::weak_ptr<Task>> queue;
    mutable std::mutex              mutex;
    std::condition_variable         wakeup;
    bool                            stopping = false; // guarded by mutex
};

} // namespace PV
