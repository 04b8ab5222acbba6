#ifdef ST_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace ST {

/**
 * Asynchronous tagged logger. `st_log` enqueues; a worker thread formats and
 * writes to stderr. Tag filters and the initial on/off switch come from the
 * SLIDETRACK_LOG* environment variables read at construction. The destructor
 * writes everything still queued before it returns.
 */
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point when;
        std::set<std::string>                 tags;
        std::string                           text;
        std::string                           thread;
        std::source_location                  where;
    };

    // Messages carrying any skipped tag are dropped. When `required` is not
    // empty every tag of a message must be listed in it.
    struct TagFilter {
        std::set<std::string> skipped{"INFO", "Tick", "FrameScheduler", "MotionSimulator"};
        std::set<std::string> required;

        [[nodiscard]] auto allows(std::set<std::string> const& tags) const -> bool;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)                    = delete;
    auto operator=(TaggedLogger const&) -> TaggedLogger& = delete;

    template <typename... Tags>
    auto log_impl(std::string const& text, std::source_location const& where, Tags&&... tags) -> void;

    auto setThreadName(std::string const& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;

    // Held while anything is written to stdout or stderr.
    static std::mutex coutMutex;

private:
    auto push(Entry entry) -> void;
    auto run() -> void;
    auto write(Entry const& entry) const -> void;
    auto threadName(std::thread::id id) -> std::string;

    TagFilter         filter_;
    std::atomic<bool> enabled_{false};

    std::mutex              queueMutex_;
    std::condition_variable wake_;
    std::deque<Entry>       queue_;
    bool                    stopping_ = false;

    std::mutex                                       namesMutex_;
    std::unordered_map<std::thread::id, std::string> names_;
    int                                              unnamedCount_ = 0;

    std::thread worker_;
};

auto logger() -> TaggedLogger&;

template <typename... Tags>
auto TaggedLogger::log_impl(std::string const& text, std::source_location const& where, Tags&&... tags) -> void {
    if (!enabled_.load(std::memory_order_relaxed)) {
        return;
    }
    this->push(Entry{
        .when   = std::chrono::system_clock::now(),
        .tags   = {std::string(std::forward<Tags>(tags))...},
        .text   = text,
        .thread = this->threadName(std::this_thread::get_id()),
        .where  = where,
    });
}

auto set_thread_name(std::string const& name) -> void;
auto set_logging_enabled(bool enabled) -> void;

} // namespace ST

#define st_log(message, ...) ::ST::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

#else
#define st_log(message, ...) ((void)0)
#endif // ST_LOG_DEBUG
