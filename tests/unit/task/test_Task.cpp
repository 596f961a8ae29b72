#include "task/Task.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace PV;

TEST_SUITE("task.lifecycle") {
TEST_CASE("Task walks the happy path once") {
    auto task = Task::Create([](Task&) {});
    CHECK(task->state() == TaskState::NotStarted);
    CHECK_FALSE(task->hasStarted());

    CHECK(task->tryStart());
    CHECK_FALSE(task->tryStart());
    CHECK(taskStateToString(task->state()) == "Starting");

    CHECK(task->transitionToRunning());
    CHECK_FALSE(task->isTerminal());

    CHECK(task->markCompleted());
    CHECK(task->isCompleted());
    CHECK(task->isTerminal());
    CHECK_FALSE(task->markCompleted());
    CHECK_FALSE(task->markFailed());
}

TEST_CASE("Task can fail from any non-terminal state") {
    SUBCASE("never started") {
        auto task = Task::Create([](Task&) {});
        CHECK(task->markFailed());
        CHECK_FALSE(task->tryStart());
        CHECK(task->isFailed());
    }
    SUBCASE("while running") {
        auto task = Task::Create([](Task&) {});
        REQUIRE(task->tryStart());
        REQUIRE(task->transitionToRunning());
        CHECK(task->markFailed());
        CHECK_FALSE(task->markCompleted());
        CHECK(task->state() == TaskState::Failed);
    }
}

TEST_CASE("Only one racer wins tryStart") {
    auto             task = Task::Create([](Task&) {});
    std::atomic<int> winners{0};
    {
        std::vector<std::jthread> racers;
        for (int i = 0; i < 8; ++i)
            racers.emplace_back([&] {
                if (task->tryStart())
                    ++winners;
            });
    }
    CHECK(winners.load() == 1);
}
}
