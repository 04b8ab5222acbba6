#pragma once
#include <slidetrack/scheduler/Clock.hpp>

#include <chrono>
#include <functional>
#include <optional>

namespace ST {

/**
 * Single-shot timer polled by the frame scheduler. Re-arming replaces the
 * pending deadline and callback, which is what debouncing needs.
 */
class DeadlineTimer {
public:
    explicit DeadlineTimer(Clock const& clock);

    auto arm(std::chrono::milliseconds delay, std::function<void()> callback) -> void;
    auto cancel() -> bool;

    // Fires the callback when the deadline has passed. Returns true if it fired.
    auto poll() -> bool;

    [[nodiscard]] auto armed() const -> bool { return deadline_.has_value(); }
    [[nodiscard]] auto deadline() const -> std::optional<Clock::TimePoint> const& { return deadline_; }

private:
    Clock const&                   clock_;
    std::optional<Clock::TimePoint> deadline_;
    std::function<void()>          callback_;
};

} // namespace ST
