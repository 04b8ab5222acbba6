#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef ST_LOG_DEBUG
        std::lock_guard<std::mutex> lock(ST::TaggedLogger::coutMutex);
#endif
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
#ifdef ST_LOG_DEBUG
        std::lock_guard<std::mutex> lock(ST::TaggedLogger::coutMutex);
#endif
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
#ifdef ST_LOG_DEBUG
    ST::set_logging_enabled(false);
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);

    if (context.shouldExit()) {
        return context.run();
    }

#ifdef ST_LOG_DEBUG
    ST::set_thread_name("TestMain");
    // SLIDETRACK_LOG=1 turns on tagged logging for the whole run.
    bool enableLog = false;
    if (const char* env = std::getenv("SLIDETRACK_LOG")) {
        enableLog = std::strcmp(env, "0") != 0;
    }
    if (enableLog) {
        ST::set_logging_enabled(true);
        st_log("Starting test execution", "TEST");
    }
#endif

    int res = context.run();

#ifdef ST_LOG_DEBUG
    if (enableLog) {
        st_log(res == 0 ? "All tests passed" : "Some tests failed", "TEST");
    }
#endif
    return res;
}
