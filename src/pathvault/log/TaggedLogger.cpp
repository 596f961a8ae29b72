#ifdef PV_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>
#include <vector>

namespace PV {

namespace {

std::atomic<int>        unnamedThreads{0};
thread_local std::string currentThreadName;

auto trim(std::string_view text) -> std::string_view {
    auto const first = text.find_first_not_of(' ');
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(' ');
    return text.substr(first, last - first + 1);
}

auto parseTagList(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    std::size_t           start = 0;
    while (start <= text.size()) {
        auto const comma = std::min(text.find(',', start), text.size());
        if (auto const token = trim(text.substr(start, comma - start)); !token.empty())
            tags.emplace(token);
        start = comma + 1;
    }
    return tags;
}

// "dir/file.cpp" out of an absolute source path.
auto sourceTail(std::string_view file) -> std::string_view {
    auto const last = file.rfind('/');
    if (last == std::string_view::npos || last == 0)
        return file;
    auto const previous = file.rfind('/', last - 1);
    return previous == std::string_view::npos ? file : file.substr(previous + 1);
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    if (const char* env = std::getenv("PATHVAULT_LOG_TAGS"))
        this->enabledTags = parseTagList(env);
    this->worker = std::jthread([this](std::stop_token stop) { this->drain(stop); });
}

auto TaggedLogger::setLoggingEnabled(bool on) -> void {
    this->enabled.store(on, std::memory_order_relaxed);
}

auto TaggedLogger::loggingEnabled() const -> bool {
    return this->enabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->filterMutex);
    this->enabledTags = std::move(tags);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->idle.wait(lock, [this] { return this->pending.empty() && !this->busy; });
}

auto TaggedLogger::setThreadName(std::string name) -> void {
    currentThreadName = std::move(name);
}

auto TaggedLogger::threadName() -> std::string const& {
    if (currentThreadName.empty())
        currentThreadName = "thread-" + std::to_string(unnamedThreads++);
    return currentThreadName;
}

auto TaggedLogger::drain(std::stop_token stop) -> void {
    std::unique_lock<std::mutex> lock(this->mutex);
    for (;;) {
        this->wake.wait(lock, stop, [this] { return !this->pending.empty(); });
        if (this->pending.empty()) {
            this->idle.notify_all();
            return; // stop requested and nothing left to write
        }

        std::vector<Record> batch(std::make_move_iterator(this->pending.begin()), std::make_move_iterator(this->pending.end()));
        this->pending.clear();
        this->busy = true;
        lock.unlock();

        std::string out;
        for (auto const& record : batch)
            if (this->accepts(record.tags))
                out += format(record);
        if (!out.empty()) {
            std::lock_guard<std::mutex> coutLock(coutMutex);
            std::cerr << out << std::flush;
        }

        lock.lock();
        this->busy = false;
        this->idle.notify_all();
    }
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(this->filterMutex);
    for (auto const& tag : tags) {
        if (!this->enabledTags.empty() && !this->enabledTags.contains(tag))
            return false;
        if (this->skipTags.contains(tag) && !this->enabledTags.contains(tag))
            return false;
    }
    return true;
}

auto TaggedLogger::format(Record const& record) -> std::string {
    auto const seconds = std::chrono::system_clock::to_time_t(record.when);
    auto const millis  = std::chrono::duration_cast<std::chrono::milliseconds>(record.when.time_since_epoch()).count() % 1000;
    std::tm    local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << ' ';
    for (auto const& tag : record.tags)
        line << '[' << tag << ']';
    line << " [" << record.thread << "] " << sourceTail(record.where.file_name()) << ':' << record.where.line() << ' '
         << record.text << '\n';
    return line.str();
}

void set_thread_name(const std::string& name) {
    TaggedLogger::setThreadName(name);
}

void set_logging_enabled(bool on) {
    logger().setLoggingEnabled(on);
}

} // namespace PV
#endif // PV_LOG_DEBUG
