#pragma once
#include <slidetrack/core/Error.hpp>
#include <slidetrack/events/EventBus.hpp>

#include <cstdint>
#include <optional>

namespace ST {

struct MotionOptions {
    double attraction = 0.026;
    double friction   = 0.28;
};

/**
 * Spring/damper integrator moving a scalar position toward a target.
 *
 * Friction is applied as `(1 - friction)^scaledDelta`, so the trajectory is
 * stable across frame rates. Every tick emits `Events::PositionChanged` on the
 * simulator's own bus; arrival emits a final snapped `PositionChanged` with
 * progress 1 followed by `Events::MotionFinished`.
 */
class MotionSimulator {
public:
    static constexpr double kVelocityBoost     = 1.4;
    static constexpr double kMinFrameDeltaMs   = 8.33;
    static constexpr double kTimeBaseMs        = 13.0;
    static constexpr double kDistanceBias      = 230.0;
    static constexpr double kDistanceReference = 200.0;
    static constexpr double kMinDistanceRatio  = 0.8;
    static constexpr double kMaxDistanceRatio  = 1.3;
    static constexpr double kArrivalStep       = 0.01;
    static constexpr double kArrivalDistance   = 0.1;

    explicit MotionSimulator(MotionOptions options = {});

    MotionSimulator(MotionSimulator const&)                    = delete;
    auto operator=(MotionSimulator const&) -> MotionSimulator& = delete;

    // Starts a new motion. A non-finite endpoint is rejected and leaves any
    // motion in flight untouched.
    auto animateTo(double start, double end, double initialVelocity) -> Expected<void>;
    auto tick(double timeMs) -> void;
    auto stop() -> void;

    // Shifts start, position and target together; used when the track rebases.
    auto rebase(double delta) -> void;

    auto setAttraction(double attraction) -> void;
    auto setFriction(double friction) -> void;

    [[nodiscard]] auto isAnimating() const -> bool { return animating_; }
    [[nodiscard]] auto attraction() const -> double { return attraction_; }
    [[nodiscard]] auto friction() const -> double { return friction_; }
    [[nodiscard]] auto position() const -> double { return current_; }
    [[nodiscard]] auto velocity() const -> double { return velocity_; }
    [[nodiscard]] auto target() const -> double { return target_; }
    [[nodiscard]] auto start() const -> double { return start_; }

    [[nodiscard]] auto events() -> EventBus& { return events_; }

private:
    static auto validateCoefficient(char const* name, double value) -> double;

    EventBus              events_;
    double                attraction_ = 0.026;
    double                friction_   = 0.28;
    double                start_      = 0.0;
    double                current_    = 0.0;
    double                target_     = 0.0;
    double                velocity_   = 0.0;
    bool                  animating_  = false;
    std::optional<double> previousTime_;
};

} // namespace ST
