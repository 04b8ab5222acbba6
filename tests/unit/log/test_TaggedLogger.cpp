#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#ifdef ST_LOG_DEBUG

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }
    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

// Clears every SLIDETRACK_LOG* variable, then applies the overrides.
class LogEnvironment {
public:
    LogEnvironment(std::initializer_list<std::pair<char const*, char const*>> overrides = {}) {
        for (auto const* name : {"SLIDETRACK_LOG_ENABLED", "SLIDETRACK_LOG", "SLIDETRACK_LOG_CLEAR_DEFAULT_SKIPS",
                                 "SLIDETRACK_LOG_ENABLE_TAGS", "SLIDETRACK_LOG_SKIP_TAGS"}) {
            guards.push_back(std::make_unique<EnvGuard>(name, nullptr));
        }
        for (auto const& [name, value] : overrides) {
            guards.push_back(std::make_unique<EnvGuard>(name, value));
        }
    }

private:
    std::vector<std::unique_ptr<EnvGuard>> guards;
};

// A scoped logger drains its queue on destruction, so the capture is complete.
template <typename Fn>
auto captureStderr(Fn&& fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

template <typename... Tags>
auto logOnce(std::string const& message, Tags... tags) -> std::string {
    return captureStderr([&] {
        ST::TaggedLogger logger;
        logger.log_impl(message, std::source_location::current(), tags...);
    });
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("messages are dropped until logging is enabled") {
    LogEnvironment env;
    CHECK(logOnce("silent", "Carousel").empty());
}

TEST_CASE("SLIDETRACK_LOG enables output with tags and thread name") {
    LogEnvironment env{{"SLIDETRACK_LOG", "1"}};
    auto output = logOnce("hello track", "TrackCoordinator");
    CHECK(output.find("[TrackCoordinator]") != std::string::npos);
    CHECK(output.find("hello track") != std::string::npos);
    CHECK(output.find("[Thread 0]") != std::string::npos);
}

TEST_CASE("SLIDETRACK_LOG=0 keeps logging off") {
    LogEnvironment env{{"SLIDETRACK_LOG", "0"}};
    CHECK(logOnce("still silent", "Carousel").empty());
}

TEST_CASE("per-frame tags are skipped by default") {
    LogEnvironment env{{"SLIDETRACK_LOG_ENABLED", "1"}};
    CHECK(logOnce("tick", "FrameScheduler", "Tick").empty());
    CHECK(logOnce("motion", "MotionSimulator").empty());
    CHECK(logOnce("info", "INFO").empty());
    CHECK_FALSE(logOnce("kept", "EventBus").empty());
}

TEST_CASE("clearing default skips lets frame chatter through") {
    LogEnvironment env{{"SLIDETRACK_LOG_ENABLED", "1"}, {"SLIDETRACK_LOG_CLEAR_DEFAULT_SKIPS", "1"}};
    CHECK(logOnce("rendered", "FrameScheduler").find("rendered") != std::string::npos);
}

TEST_CASE("enabled tags gate every tag of a message") {
    LogEnvironment env{{"SLIDETRACK_LOG_ENABLED", "1"}, {"SLIDETRACK_LOG_ENABLE_TAGS", "Config"}};
    CHECK(logOnce("parsed", "Config").find("parsed") != std::string::npos);
    CHECK(logOnce("mixed", "Config", "ERROR").empty());
}

TEST_CASE("skip tag list is trimmed and extends the defaults") {
    LogEnvironment env{{"SLIDETRACK_LOG_ENABLED", "1"}, {"SLIDETRACK_LOG_SKIP_TAGS", " EffectManager , Carousel "}};
    CHECK(logOnce("skipped", "Carousel").empty());
    CHECK(logOnce("skipped too", "EffectManager").empty());
    CHECK(logOnce("still default", "Tick").empty());
    CHECK(logOnce("visible", "EventBus").find("visible") != std::string::npos);
}

TEST_CASE("explicit switch overrides the environment") {
    LogEnvironment env{{"SLIDETRACK_LOG_ENABLED", "1"}};
    auto output = captureStderr([] {
        ST::TaggedLogger logger;
        logger.setLoggingEnabled(false);
        logger.log_impl("off", std::source_location::current(), "Test");
        logger.setLoggingEnabled(true);
        logger.setThreadName("Render-1");
        logger.log_impl("on", std::source_location::current(), "Test");
    });
    CHECK(output.find("off") == std::string::npos);
    CHECK(output.find("[Render-1]") != std::string::npos);
}

TEST_CASE("location is reported as parent directory and file") {
    LogEnvironment env{{"SLIDETRACK_LOG_ENABLED", "1"}};
    auto output = captureStderr([] {
        ST::TaggedLogger logger;
#line 77 "src/slidetrack/FakeSource.cpp"
        logger.log_impl("located", std::source_location::current(), "Test");
#line 160 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("slidetrack/FakeSource.cpp:77") != std::string::npos);
}

TEST_CASE("global macro joins tags") {
    LogEnvironment env;
    auto output = captureStderr([] {
        ST::set_thread_name("MacroThread");
        ST::set_logging_enabled(true);
        st_log("via macro", "Alpha", "Beta");
        std::this_thread::sleep_for(50ms);
        ST::set_logging_enabled(false);
    });
    CHECK(output.find("[Alpha][Beta]") != std::string::npos);
    CHECK(output.find("[MacroThread]") != std::string::npos);
}

} // TEST_SUITE

#endif // ST_LOG_DEBUG
