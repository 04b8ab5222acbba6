#ifdef ST_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <format>
#include <iostream>
#include <ranges>
#include <string_view>
#include <utility>

namespace ST {

namespace {

auto env_flag(char const* name) -> bool {
    char const* value = std::getenv(name);
    return value != nullptr && *value != '\0' && std::string_view{value} != "0";
}

auto env_tags(char const* name) -> std::set<std::string> {
    std::set<std::string> tags;
    char const*           value = std::getenv(name);
    if (value == nullptr) {
        return tags;
    }
    for (auto const part : std::string_view{value} | std::views::split(',')) {
        std::string_view token{part.begin(), part.end()};
        auto const       first = token.find_first_not_of(" \t");
        if (first == std::string_view::npos) {
            continue;
        }
        auto const last = token.find_last_not_of(" \t");
        tags.emplace(token.substr(first, last - first + 1));
    }
    return tags;
}

// "parent/file.cpp" for any depth of path.
auto short_path(char const* file) -> std::string {
    std::filesystem::path const path{file};
    if (!path.has_parent_path()) {
        return path.filename().string();
    }
    return (path.parent_path().filename() / path.filename()).string();
}

auto timestamp(std::chrono::system_clock::time_point when) -> std::string {
    auto const seconds = std::chrono::system_clock::to_time_t(when);
    auto const millis  = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    char buffer[32];
    auto const length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return std::format("{}.{:03}", std::string_view{buffer, length}, millis.count());
}

} // namespace

std::mutex TaggedLogger::coutMutex;

auto logger() -> TaggedLogger& {
    static TaggedLogger instance;
    return instance;
}

auto TaggedLogger::TagFilter::allows(std::set<std::string> const& tags) const -> bool {
    if (!required.empty() && !std::ranges::all_of(tags, [this](auto const& tag) { return required.contains(tag); })) {
        return false;
    }
    return std::ranges::none_of(tags, [this](auto const& tag) { return skipped.contains(tag); });
}

TaggedLogger::TaggedLogger() {
    if (env_flag("SLIDETRACK_LOG_ENABLED") || env_flag("SLIDETRACK_LOG")) {
        enabled_.store(true, std::memory_order_relaxed);
    }
    if (env_flag("SLIDETRACK_LOG_CLEAR_DEFAULT_SKIPS")) {
        filter_.skipped.clear();
    }
    filter_.skipped.merge(env_tags("SLIDETRACK_LOG_SKIP_TAGS"));
    filter_.required = env_tags("SLIDETRACK_LOG_ENABLE_TAGS");

    worker_ = std::thread([this] { this->run(); });
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = true;
    }
    wake_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto TaggedLogger::setThreadName(std::string const& name) -> void {
    std::lock_guard<std::mutex> lock(namesMutex_);
    names_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::push(Entry entry) -> void {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.push_back(std::move(entry));
    }
    wake_.notify_one();
}

auto TaggedLogger::run() -> void {
    std::unique_lock<std::mutex> lock(queueMutex_);
    while (true) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;
        }
        auto batch = std::exchange(queue_, {});
        lock.unlock();
        for (auto const& entry : batch) {
            this->write(entry);
        }
        lock.lock();
    }
}

auto TaggedLogger::write(Entry const& entry) const -> void {
    if (!filter_.allows(entry.tags)) {
        return;
    }

    std::string line = timestamp(entry.when);
    line += ' ';
    for (auto const& tag : entry.tags) {
        line += std::format("[{}]", tag);
    }
    line += std::format(" [{}] [{}:{}] {}\n", entry.thread, short_path(entry.where.file_name()), entry.where.line(), entry.text);

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line << std::flush;
}

auto TaggedLogger::threadName(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(namesMutex_);
    auto [it, inserted] = names_.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(unnamedCount_++);
    }
    return it->second;
}

auto set_thread_name(std::string const& name) -> void {
    logger().setThreadName(name);
}

auto set_logging_enabled(bool enabled) -> void {
    logger().setLoggingEnabled(enabled);
}

} // namespace ST
#endif // ST_LOG_DEBUG
