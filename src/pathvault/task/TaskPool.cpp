#include "TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <system_error>

namespace PV {

TaskPool::TaskPool(size_t threadCount) {
    threadCount = std::max<size_t>(threadCount, 1);
    this->workers.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            this->workers.emplace_back([this] { this->workerLoop(); });
        } catch (std::system_error const& e) {
            // A pool with fewer workers still works; zero workers makes submit() fail.
            pv_log(std::string("TaskPool could not spawn worker: ") + e.what(), "TaskPool", "Error");
            break;
        }
    }
    pv_log("TaskPool started with " + std::to_string(this->workers.size()) + " workers", "TaskPool");
}

TaskPool::~TaskPool() {
    this->shutdown();
}

auto TaskPool::submit(std::weak_ptr<Task>&& task) -> std::optional<Error> {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->stopping)
            return Error{Error::Code::Unavailable, "task pool is shutting down"};
        if (this->workers.empty())
            return Error{Error::Code::Unavailable, "task pool has no workers"};

        auto owner = task.lock();
        if (!owner)
            return Error{Error::Code::Unavailable, "task expired before it was queued"};
        if (!owner->tryStart())
            return Error{Error::Code::Unavailable, "task was already submitted"};

        this->queue.push(std::move(task));
    }
    this->wakeup.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->stopping = true;
    }
    this->wakeup.notify_all();
    this->joinWorkers();
}

auto TaskPool::joinWorkers() -> void {
    std::vector<std::jthread> joining;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        joining.swap(this->workers);
    }
    if (!joining.empty())
        pv_log("TaskPool joining " + std::to_string(joining.size()) + " workers", "TaskPool");
    for (auto& worker : joining) {
        if (worker.joinable())
            worker.join();
    }
}

auto TaskPool::size() const -> size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->workers.size();
}

auto TaskPool::workerLoop() -> void {
    for (;;) {
        std::weak_ptr<Task> next;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->wakeup.wait(lock, [this] { return this->stopping || !this->queue.empty(); });
            if (this->queue.empty())
                return; // stopping and drained
            next = std::move(this->queue.front());
            this->queue.pop();
        }

        if (auto task = next.lock())
            this->run(*task);
        else
            pv_log("TaskPool dropped a task that expired in the queue", "TaskPool");
    }
}

auto TaskPool::run(Task& task) -> void {
    try {
        task.transitionToRunning();
        if (task.function)
            task.function(task);
        task.markCompleted();
    } catch (std::exception const& e) {
        task.markFailed();
        pv_log(std::string("Task threw: ") + e.what(), "TaskPool", "Error");
    } catch (...) {
        task.markFailed();
        pv_log("Task threw a non-standard exception", "TaskPool", "Error");
    }

    if (task.finished)
        task.finished(task);
}

} // namespace PV
