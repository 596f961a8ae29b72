#ifdef PV_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <source_location>
#include <stop_token>
#include <string>
#include <thread>

namespace PV {

/**
 * TaggedLogger — asynchronous stderr logger keyed by free-form tags
 *
 * Callers only append a Record to the pending queue; a jthread owned by the
 * logger formats and writes them in batches. A record is dropped when it
 * carries a tag from the skip set, or when an enabled set is configured and
 * one of its tags is outside it. PATHVAULT_LOG_TAGS (comma separated) seeds
 * the enabled set. Records still pending at destruction are written first.
 */
class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point when;
        std::set<std::string>                 tags;
        std::string                           text;
        std::string                           thread;
        std::source_location                  where;
    };

    TaggedLogger();
    ~TaggedLogger() = default;

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setLoggingEnabled(bool enabled) -> void;
    auto loggingEnabled() const -> bool;
    auto setEnabledTags(std::set<std::string> tags) -> void;
    // Blocks until every record queued so far has been written or filtered.
    auto flush() -> void;

    // Thread names are per thread and shared by all loggers.
    static auto setThreadName(std::string name) -> void;
    static auto threadName() -> std::string const&;

    static auto format(Record const& record) -> std::string;

    static std::mutex coutMutex;

private:
    auto drain(std::stop_token stop) -> void;
    auto accepts(std::set<std::string> const& tags) const -> bool;

    std::mutex                  mutex;
    std::condition_variable_any wake;
    std::condition_variable_any idle;
    std::deque<Record>          pending;
    bool                        busy = false;
    std::atomic<bool>           enabled{false};

    mutable std::mutex    filterMutex;
    std::set<std::string> skipTags{"Function Called", "TaskPool", "Task"};
    std::set<std::string> enabledTags;

    std::jthread worker; // declared last: stops and joins before the queue goes away
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;

    Record record{std::chrono::system_clock::now(), {std::string(std::forward<Tags>(tags))...}, message, threadName(), location};
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->pending.push_back(std::move(record));
    }
    this->wake.notify_one();
}

#define pv_log(message, ...) ::PV::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace PV

#else
#define pv_log(message, ...) ((void)0)
#endif // PV_LOG_DEBUG
