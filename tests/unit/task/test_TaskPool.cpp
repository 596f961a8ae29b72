#include "task/TaskPool.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace PV;
using namespace std::chrono_literals;

namespace {
template <typename Pred>
auto waitFor(Pred pred, std::chrono::milliseconds timeout = 5000ms) -> bool {
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::yield();
    }
    return true;
}
} // namespace

TEST_SUITE("task.pool") {
TEST_CASE("TaskPool Misc") {
    SUBCASE("Basic task execution") {
        TaskPool          pool(2);
        std::atomic<int>  counter{0};
        std::atomic<bool> done{false};

        auto task = Task::Create([&counter](Task&) { counter++; });
        task->onFinished([&done](Task&) { done = true; });
        CHECK_FALSE(pool.submit(task).has_value());
        REQUIRE(waitFor([&] { return done.load(); }));

        CHECK(counter == 1);
        CHECK(task->isCompleted());
    }

    SUBCASE("Multiple tasks execution") {
        TaskPool         pool(4);
        std::atomic<int> counter{0};
        const int        NUM_TASKS = 100;

        std::vector<std::shared_ptr<Task>> tasks;
        tasks.reserve(NUM_TASKS);
        for (int i = 0; i < NUM_TASKS; ++i) {
            auto task = Task::Create([&counter](Task&) { counter++; });
            tasks.push_back(task);
            CHECK_FALSE(pool.submit(task).has_value());
        }

        REQUIRE(waitFor([&] { return counter.load() == NUM_TASKS; }));
        CHECK(pool.size() == 4);
    }

    SUBCASE("Shutdown behavior") {
        TaskPool pool(2);
        pool.shutdown();
        CHECK(pool.size() == 0);

        auto task    = Task::Create([](Task&) {});
        auto refused = pool.submit(task);
        REQUIRE(refused.has_value());
        CHECK(refused->code == Error::Code::Unavailable);
        CHECK_FALSE(task->hasStarted());
    }

    SUBCASE("Queued tasks finish before shutdown returns") {
        std::atomic<int> counter{0};
        std::vector<std::shared_ptr<Task>> tasks;
        {
            TaskPool pool(1);
            for (int i = 0; i < 10; ++i) {
                auto task = Task::Create([&counter](Task&) {
                    std::this_thread::sleep_for(1ms);
                    counter++;
                });
                tasks.push_back(task);
                CHECK_FALSE(pool.submit(task).has_value());
            }
        }
        CHECK(counter == 10);
    }
}

TEST_CASE("TaskPool refuses expired and resubmitted tasks") {
    TaskPool pool(1);

    std::weak_ptr<Task> expired;
    {
        auto task = Task::Create([](Task&) {});
        expired   = task;
    }
    auto gone = pool.submit(std::move(expired));
    REQUIRE(gone.has_value());
    CHECK(gone->code == Error::Code::Unavailable);

    std::atomic<bool> done{false};
    auto              task = Task::Create([](Task&) {});
    task->onFinished([&done](Task&) { done = true; });
    CHECK_FALSE(pool.submit(task).has_value());
    auto twice = pool.submit(task);
    REQUIRE(twice.has_value());
    CHECK(twice->code == Error::Code::Unavailable);
    REQUIRE(waitFor([&] { return done.load(); }));
}

TEST_CASE("A throwing task is marked failed and still finishes") {
    TaskPool          pool(1);
    std::atomic<bool> finished{false};
    std::atomic<bool> sawFailure{false};

    auto task = Task::Create([](Task&) { throw std::runtime_error("boom"); });
    task->onFinished([&](Task& t) {
        sawFailure = t.isFailed();
        finished   = true;
    });
    CHECK_FALSE(pool.submit(task).has_value());
    REQUIRE(waitFor([&] { return finished.load(); }));
    CHECK(sawFailure);
    CHECK(task->isTerminal());

    // The worker survives the exception.
    std::atomic<bool> ran{false};
    auto              next = Task::Create([&ran](Task&) { ran = true; });
    CHECK_FALSE(pool.submit(next).has_value());
    REQUIRE(waitFor([&] { return ran.load(); }));
}
}
