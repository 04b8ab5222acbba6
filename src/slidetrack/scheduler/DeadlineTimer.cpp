#include <slidetrack/scheduler/DeadlineTimer.hpp>

namespace ST {

DeadlineTimer::DeadlineTimer(Clock const& clock)
    : clock_(clock) {}

auto DeadlineTimer::arm(std::chrono::milliseconds delay, std::function<void()> callback) -> void {
    deadline_ = clock_.now() + delay;
    callback_ = std::move(callback);
}

auto DeadlineTimer::cancel() -> bool {
    if (!deadline_) {
        return false;
    }
    deadline_.reset();
    callback_ = nullptr;
    return true;
}

auto DeadlineTimer::poll() -> bool {
    if (!deadline_ || clock_.now() < *deadline_) {
        return false;
    }
    // Disarm first so the callback may re-arm this timer.
    deadline_.reset();
    auto callback = std::move(callback_);
    callback_     = nullptr;
    if (callback) {
        callback();
    }
    return true;
}

} // namespace ST
