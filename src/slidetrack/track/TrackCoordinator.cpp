#include <slidetrack/track/TrackCoordinator.hpp>

#include <slidetrack/events/Events.hpp>
#include <slidetrack/track/TrackMath.hpp>

#include "log/TaggedLogger.hpp"

#include <cmath>
#include <string>

namespace ST {

TrackCoordinator::TrackCoordinator(ReactiveStore& store, std::shared_ptr<EventBus> bus)
    : store_(store)
    , bus_(std::move(bus))
    , simulator_(MotionOptions{.attraction = store.getOptions().attraction, .friction = store.getOptions().friction}) {
    if (!bus_) {
        throw ConfigurationError("TrackCoordinator requires an event bus");
    }
    this->bindEvents();
}

TrackCoordinator::~TrackCoordinator() {
    simulator_.stop();
    for (auto id : subscriptions_) {
        bus_->off(id);
    }
}

auto TrackCoordinator::bindEvents() -> void {
    subscriptions_.push_back(bus_->on<Events::AnimationRequested>(
        [this](Events::AnimationRequested const& request) { this->onAnimationRequested(request); }));
    subscriptions_.push_back(bus_->on<Events::DragStarted>([this](Events::DragStarted const&) { this->onDragStarted(); }));
    subscriptions_.push_back(bus_->on<Events::DragMoved>([this](Events::DragMoved const& drag) { this->onDragMoved(drag); }));
    subscriptions_.push_back(bus_->on<Events::DragEnded>([this](Events::DragEnded const& drag) { this->onDragEnded(drag); }));
    subscriptions_.push_back(bus_->on<Events::OptionsChanged>(
        [this](Events::OptionsChanged const& change) { this->onOptionsChanged(change.current); }));

    // The simulator bus is private to this coordinator and dies with it.
    simulator_.events().on<Events::PositionChanged>(
        [this](Events::PositionChanged const& change) { this->onPositionChanged(change); });
    simulator_.events().on<Events::MotionFinished>([this](Events::MotionFinished const&) {
        bus_->emit(Events::MotionFinished{.finalPosition = targetOffset_});
    });
}

auto TrackCoordinator::canLoop() const -> bool {
    return Track::canLoop(store_.getState().slideCount, store_.getOptions());
}

auto TrackCoordinator::trackOffsetForIndex(int index) const -> double {
    return Track::trackOffsetForIndex(index, store_.getWidths(), store_.getOptions(), this->canLoop());
}

auto TrackCoordinator::indexForTrackOffset(double offset) const -> int {
    return Track::indexForTrackOffset(offset, store_.getWidths(), store_.getState().slideCount);
}

auto TrackCoordinator::animateToSlide(int index, std::optional<double> velocity, AnimationType type) -> void {
    this->animateToTrackPosition(this->trackOffsetForIndex(index), velocity, type);
}

auto TrackCoordinator::animateToTrackPosition(double target, std::optional<double> velocity, AnimationType type) -> void {
    if (!std::isfinite(target)) {
        st_log("Ignoring non-finite track target", "TrackCoordinator", "ERROR");
        return;
    }

    if (type == AnimationType::Instant) {
        simulator_.stop();
        type_         = type;
        direction_    = 0;
        targetOffset_ = target;
        this->setPos(target, 1.0, 0.0, AnimationType::Instant, 0);
        return;
    }

    if (this->canLoop()) {
        target = Track::resolveLoopTarget(currentOffset_, target, store_.getWidths().track, velocity);
    }
    auto const launch    = Track::resolveLaunchVelocity(currentOffset_, target, velocity);
    auto const direction = Track::directionOf(currentOffset_, target);

    if (simulator_.isAnimating() && targetOffset_ == target) {
        return;
    }

    simulator_.stop();
    type_         = type;
    direction_    = direction;
    targetOffset_ = target;
    if (auto started = simulator_.animateTo(currentOffset_, target, launch); !started) {
        st_log("Motion rejected: " + describeError(started.error()), "TrackCoordinator", "ERROR");
    }
}

auto TrackCoordinator::settle() -> void {
    this->animateToSlide(store_.getState().renderIndex, 0.0, AnimationType::Settling);
}

auto TrackCoordinator::stop() -> void {
    simulator_.stop();
}

auto TrackCoordinator::setPos(double offset, double progress, double velocity, AnimationType type, std::optional<int> direction) -> void {
    auto trackDelta = offset - currentOffset_;
    if (type != AnimationType::Dragging && progress == 1.0) {
        trackDelta = 0.0;
    }

    currentOffset_ = offset;

    if (this->canLoop()) {
        auto const trackLength = store_.getWidths().track;
        if (trackLength > 0.0) {
            if (currentOffset_ > 0.0) {
                this->shiftTrack(1);
            } else if (currentOffset_ <= -trackLength) {
                this->shiftTrack(-1);
            }
        }
    }

    store_.setAnimation(AnimationPatch{
        .type      = type,
        .offset    = currentOffset_,
        .delta     = trackDelta,
        .velocity  = velocity,
        .progress  = progress,
        .isRunning = simulator_.isAnimating(),
        .direction = direction.value_or(direction_),
    });
}

auto TrackCoordinator::shiftTrack(int direction) -> void {
    auto const delta = -store_.getWidths().track * direction;

    currentOffset_ += delta;
    dragBaseline_ += delta;
    targetOffset_ += delta;
    simulator_.rebase(delta);

    st_log("Track rebased by " + std::to_string(delta), "TrackCoordinator");
    bus_->emit(Events::TrackShifted{.rebaseDelta = delta, .trackPosition = currentOffset_});
}

auto TrackCoordinator::advance(double timeMs) -> void {
    simulator_.tick(timeMs);
}

auto TrackCoordinator::refreshVirtualization(Track::LoopBuffer const& loopBuffer) -> void {
    auto const slides = store_.getSlides();
    if (slides.empty()) {
        return;
    }
    auto const positions = Track::computeSlidePositions(slides, store_.getWidths(), store_.getOptions(), currentOffset_, loopBuffer);

    bool changed = false;
    for (std::size_t i = 0; i < slides.size() && !changed; ++i) {
        changed = slides[i].renderIndex != positions[i].renderIndex
                  || slides[i].trackPosition != positions[i].trackPosition
                  || slides[i].centerPoint != positions[i].centerPoint;
    }
    if (!changed) {
        return;
    }
    if (auto written = store_.setSlidePositions(positions); !written) {
        st_log("Virtualisation write failed: " + describeError(written.error()), "TrackCoordinator", "ERROR");
    }
}

auto TrackCoordinator::onAnimationRequested(Events::AnimationRequested const& request) -> void {
    if (request.trackPosition) {
        this->animateToTrackPosition(*request.trackPosition, request.velocity, request.type);
    } else if (request.index) {
        this->animateToSlide(*request.index, request.velocity, request.type);
    }
}

auto TrackCoordinator::onPositionChanged(Events::PositionChanged const& change) -> void {
    if (change.progress == 1.0) {
        this->setPos(targetOffset_, change.progress, change.velocity, type_, direction_);
    } else {
        this->setPos(currentOffset_ + change.delta, change.progress, change.velocity, type_, direction_);
    }
}

auto TrackCoordinator::onDragStarted() -> void {
    simulator_.stop();
    dragBaseline_ = currentOffset_;
    store_.setState(RuntimeStatePatch{.isDragging = true});
}

auto TrackCoordinator::onDragMoved(Events::DragMoved const& drag) -> void {
    this->setPos(dragBaseline_ + drag.delta, 1.0, 0.0, AnimationType::Dragging, 0);
}

auto TrackCoordinator::onDragEnded(Events::DragEnded const& drag) -> void {
    store_.setState(RuntimeStatePatch{.isDragging = false});
    if (std::abs(drag.delta) < store_.getOptions().dragThreshold) {
        this->settle();
        return;
    }
    bus_->emit(Events::PageStepRequested{.step = drag.delta < 0.0 ? 1 : -1, .velocity = drag.velocity});
}

auto TrackCoordinator::onOptionsChanged(Options const& options) -> void {
    simulator_.setAttraction(options.attraction);
    simulator_.setFriction(options.friction);
}

} // namespace ST
