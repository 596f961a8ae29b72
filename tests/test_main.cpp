#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string_view>

namespace {

// Echoes each test case and subcase as it starts, so a hang in a concurrency
// test points at the case that never finished.
struct ProgressReporter : public doctest::IReporter {
    explicit ProgressReporter(const doctest::ContextOptions&) {}

    void test_case_start(const doctest::TestCaseData& in) override { announce("", in.m_name); }
    void subcase_start(const doctest::SubcaseSignature& in) override { announce("  ", in.m_name.c_str()); }

    void report_query(const doctest::QueryData&) override {}
    void test_run_start() override {}
    void test_run_end(const doctest::TestRunStats&) override {}
    void test_case_reenter(const doctest::TestCaseData&) override {}
    void test_case_end(const doctest::CurrentTestCaseStats&) override {}
    void test_case_exception(const doctest::TestCaseException&) override {}
    void subcase_end() override {}
    void log_assert(const doctest::AssertData&) override {}
    void log_message(const doctest::MessageData&) override {}
    void test_case_skipped(const doctest::TestCaseData&) override {}

private:
    static void announce(const char* indent, const char* name) {
#ifdef PV_LOG_DEBUG
        std::lock_guard<std::mutex> lock(PV::TaggedLogger::coutMutex);
#endif
        std::cout << indent << "> " << name << '\n' << std::flush;
    }
};

REGISTER_LISTENER("progress", 1, ProgressReporter);

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit())
        return context.run();

#ifdef PV_LOG_DEBUG
    // PATHVAULT_LOG set to anything but "0" turns the logger on for the run.
    char const* env     = std::getenv("PATHVAULT_LOG");
    bool const  logging = env != nullptr && std::string_view(env) != "0";
    PV::set_thread_name("test-main");
    PV::set_logging_enabled(logging);
    pv_log("test run starting", "Test");
#endif

    int const failures = context.run();

#ifdef PV_LOG_DEBUG
    pv_log(failures == 0 ? "test run passed" : "test run had failures", "Test");
    PV::logger().flush();
#endif
    return failures;
}
