#pragma once
#include <chrono>

namespace ST {

class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration  = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    [[nodiscard]] virtual auto now() const -> TimePoint = 0;
};

class SteadyClock final : public Clock {
public:
    [[nodiscard]] auto now() const -> TimePoint override { return std::chrono::steady_clock::now(); }
};

// Test clock that only moves when told to.
class ManualClock final : public Clock {
public:
    [[nodiscard]] auto now() const -> TimePoint override { return now_; }

    auto advance(Duration delta) -> void { now_ += delta; }
    auto set(TimePoint point) -> void { now_ = point; }

private:
    TimePoint now_{};
};

} // namespace ST
