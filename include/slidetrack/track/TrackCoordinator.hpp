#pragma once
#include <slidetrack/events/EventBus.hpp>
#include <slidetrack/motion/MotionSimulator.hpp>
#include <slidetrack/store/ReactiveStore.hpp>
#include <slidetrack/track/Virtualization.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace ST {

namespace Events {
struct AnimationRequested;
struct DragEnded;
struct DragMoved;
struct PositionChanged;
} // namespace Events

/**
 * Owns the continuous track offset.
 *
 * Converts slide indices to offsets, picks loop-aware animation targets,
 * drives the MotionSimulator, commits every position into the store and
 * rebases the offset by one track length whenever looping is active and the
 * offset leaves (-track, 0]. A rebase shifts the drag baseline, the in-flight
 * target and the simulator by the same delta so motion continues seamlessly.
 */
class TrackCoordinator {
public:
    TrackCoordinator(ReactiveStore& store, std::shared_ptr<EventBus> bus);
    ~TrackCoordinator();

    TrackCoordinator(TrackCoordinator const&)                    = delete;
    auto operator=(TrackCoordinator const&) -> TrackCoordinator& = delete;

    [[nodiscard]] auto trackOffsetForIndex(int index) const -> double;
    [[nodiscard]] auto indexForTrackOffset(double offset) const -> int;

    auto animateToSlide(int index, std::optional<double> velocity, AnimationType type) -> void;
    auto animateToTrackPosition(double target, std::optional<double> velocity, AnimationType type) -> void;
    auto settle() -> void;
    auto stop() -> void;

    auto setPos(double offset, double progress, double velocity, AnimationType type, std::optional<int> direction = std::nullopt) -> void;
    // +1 rebases forward (offset -= track), -1 backward.
    auto shiftTrack(int direction) -> void;

    auto advance(double timeMs) -> void;
    auto refreshVirtualization(Track::LoopBuffer const& loopBuffer) -> void;

    [[nodiscard]] auto currentOffset() const -> double { return currentOffset_; }
    [[nodiscard]] auto targetOffset() const -> double { return targetOffset_; }
    [[nodiscard]] auto dragBaseline() const -> double { return dragBaseline_; }
    [[nodiscard]] auto isAnimating() const -> bool { return simulator_.isAnimating(); }
    [[nodiscard]] auto canLoop() const -> bool;

    [[nodiscard]] auto simulator() -> MotionSimulator& { return simulator_; }
    [[nodiscard]] auto simulator() const -> MotionSimulator const& { return simulator_; }

private:
    auto bindEvents() -> void;
    auto onAnimationRequested(Events::AnimationRequested const& request) -> void;
    auto onPositionChanged(Events::PositionChanged const& change) -> void;
    auto onDragStarted() -> void;
    auto onDragMoved(Events::DragMoved const& drag) -> void;
    auto onDragEnded(Events::DragEnded const& drag) -> void;
    auto onOptionsChanged(Options const& options) -> void;

    ReactiveStore&              store_;
    std::shared_ptr<EventBus>   bus_;
    MotionSimulator             simulator_;
    std::vector<SubscriptionId> subscriptions_;
    double                      currentOffset_ = 0.0;
    double                      targetOffset_  = 0.0;
    double                      dragBaseline_  = 0.0;
    AnimationType               type_          = AnimationType::Instant;
    int                         direction_     = 0;
};

} // namespace ST
