#include "TaskGroup.hpp"
#include "log/TaggedLogger.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace PV {

TaskGroup::TaskGroup(Executor& executor, std::size_t maxInFlight)
    : executor(executor)
    , maxInFlight(maxInFlight == 0 ? 1 : maxInFlight) {}

TaskGroup::~TaskGroup() {
    this->wait();
}

auto TaskGroup::dispatch(Unit unit) -> std::optional<Error> {
    {
        std::unique_lock<std::mutex> lock(this->mutex);
        this->cv.wait(lock, [this] { return this->inFlight < this->maxInFlight; });
        ++this->inFlight;
        ++this->dispatched;
    }

    auto recorded = std::make_shared<std::atomic<bool>>(false);
    auto task     = Task::Create([this, unit = std::move(unit), recorded](Task&) {
        if (auto error = unit()) {
            recorded->store(true, std::memory_order_release);
            this->record(std::move(*error));
        }
    });
    task->onFinished([this, recorded](Task& finishedTask) {
        if (finishedTask.isFailed() && !recorded->load(std::memory_order_acquire))
            this->record(Error{Error::Code::UnknownError, "unit of work threw"});
        this->release();
    });

    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->tasks.push_back(task);
    }

    if (auto refused = this->executor.submit(task)) {
        pv_log("TaskGroup::dispatch refused: " + describeError(*refused), "TaskGroup", "Error");
        this->record(*refused);
        this->release();
        return refused;
    }
    return std::nullopt;
}

auto TaskGroup::wait() -> void {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->cv.wait(lock, [this] { return this->inFlight == 0; });
    this->tasks.clear();
}

auto TaskGroup::recordSkipped(Error error) -> void {
    this->record(std::move(error));
}

auto TaskGroup::errors() const -> std::vector<Error> {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->failures;
}

auto TaskGroup::dispatchedCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->dispatched;
}

auto TaskGroup::finishedCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->finished;
}

auto TaskGroup::record(Error error) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->failures.push_back(std::move(error));
}

auto TaskGroup::release() -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    --this->inFlight;
    ++this->finished;
    this->cv.notify_all();
}

} // namespace PV
