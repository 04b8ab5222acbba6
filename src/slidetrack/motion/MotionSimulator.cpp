#include <slidetrack/motion/MotionSimulator.hpp>

#include <slidetrack/events/Events.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace ST {

namespace {

auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

} // namespace

MotionSimulator::MotionSimulator(MotionOptions options)
    : attraction_(validateCoefficient("attraction", options.attraction))
    , friction_(validateCoefficient("friction", options.friction)) {}

auto MotionSimulator::validateCoefficient(char const* name, double value) -> double {
    if (!(value > 0.0 && value < 1.0)) {
        throw RangeError(std::string{name} + " must lie in (0, 1), got " + std::to_string(value));
    }
    return value;
}

auto MotionSimulator::setAttraction(double attraction) -> void {
    attraction_ = validateCoefficient("attraction", attraction);
}

auto MotionSimulator::setFriction(double friction) -> void {
    friction_ = validateCoefficient("friction", friction);
}

auto MotionSimulator::animateTo(double start, double end, double initialVelocity) -> Expected<void> {
    if (!std::isfinite(end) || !std::isfinite(start)) {
        st_log("Rejected non-finite motion endpoint", "MotionSimulator", "ERROR");
        return std::unexpected(make_error(Error::Code::InvalidArgument, "motion endpoints must be finite"));
    }
    if (!std::isfinite(initialVelocity)) {
        initialVelocity = 0.0;
    }

    this->stop();
    start_        = start;
    current_      = start;
    target_       = end;
    velocity_     = initialVelocity * kVelocityBoost;
    animating_    = true;
    previousTime_.reset();

    events_.emit(Events::PositionChanged{.position = start_, .delta = 0.0, .progress = 0.0, .velocity = velocity_});
    return {};
}

auto MotionSimulator::tick(double timeMs) -> void {
    if (!animating_) {
        return;
    }

    auto frameDelta = previousTime_ ? timeMs - *previousTime_ : kMinFrameDeltaMs;
    frameDelta      = std::max(frameDelta, kMinFrameDeltaMs);
    previousTime_   = timeMs;

    auto const span  = target_ - start_;
    auto const ratio = std::clamp(std::max(std::abs(span) - kDistanceBias, 1.0) / kDistanceReference,
                                  kMinDistanceRatio,
                                  kMaxDistanceRatio);
    auto const scaled = frameDelta / (kTimeBaseMs * ratio);

    auto const force = (target_ - current_) * attraction_;
    velocity_ += force * scaled;
    velocity_ *= std::pow(1.0 - friction_, scaled);

    auto const positionDelta = velocity_ * scaled;
    current_ += positionDelta;

    if (std::abs(positionDelta) < kArrivalStep && std::abs(current_ - target_) < kArrivalDistance) {
        // velocity() keeps the arrival velocity; the event reports the snapped rest state.
        current_   = target_;
        animating_ = false;
        events_.emit(Events::PositionChanged{.position = target_, .delta = 0.0, .progress = 1.0, .velocity = 0.0});
        events_.emit(Events::MotionFinished{.finalPosition = target_});
        return;
    }

    auto const progress = span != 0.0 ? (current_ - start_) / span : 0.0;
    events_.emit(Events::PositionChanged{.position = current_, .delta = positionDelta, .progress = progress, .velocity = velocity_});
}

// Position, velocity and frame time are kept as they are.
auto MotionSimulator::stop() -> void {
    animating_ = false;
}

auto MotionSimulator::rebase(double delta) -> void {
    start_   += delta;
    current_ += delta;
    target_  += delta;
}

} // namespace ST
