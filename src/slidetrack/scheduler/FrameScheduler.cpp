#include <slidetrack/scheduler/FrameScheduler.hpp>

#include <slidetrack/coords/CoordinateSystem.hpp>
#include <slidetrack/events/Events.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace ST {

FrameScheduler::FrameScheduler(ReactiveStore& store,
                               TrackCoordinator& track,
                               EffectManager& effects,
                               std::shared_ptr<EventBus> bus,
                               FrameHost& host,
                               Clock const& clock)
    : store_(store)
    , track_(track)
    , effects_(effects)
    , bus_(std::move(bus))
    , host_(host)
    , clock_(clock) {
    if (!bus_) {
        throw ConfigurationError("FrameScheduler requires an event bus");
    }
    subscriptions_.push_back(bus_->on<Events::StoreDirty>([this](Events::StoreDirty const&) { this->requestFrame(); }));
    subscriptions_.push_back(bus_->on<Events::EffectChanged>([this](Events::EffectChanged const&) { this->requestFrame(); }));
}

FrameScheduler::~FrameScheduler() {
    this->cancel();
    for (auto id : subscriptions_) {
        bus_->off(id);
    }
}

auto FrameScheduler::requestFrame() -> void {
    if (pending_ || rendering_) {
        return;
    }
    pending_ = host_.requestFrame([this](double timeMs) { this->onFrame(timeMs); });
}

auto FrameScheduler::cancel() -> void {
    if (!pending_) {
        return;
    }
    host_.cancelFrame(*pending_);
    pending_.reset();
}

auto FrameScheduler::state() const -> SchedulerState {
    if (rendering_) {
        return SchedulerState::Rendering;
    }
    return pending_ ? SchedulerState::Scheduled : SchedulerState::Idle;
}

auto FrameScheduler::setVisibilityPass(VisibilityPass pass) -> void {
    visibilityPass_ = std::move(pass);
}

auto FrameScheduler::debounce(std::string const& name, std::chrono::milliseconds delay, std::function<void()> fn) -> void {
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        it = timers_.emplace(name, std::make_unique<DeadlineTimer>(clock_)).first;
    }
    it->second->arm(delay, std::move(fn));
    this->requestFrame();
}

auto FrameScheduler::cancelTimer(std::string_view name) -> bool {
    auto it = timers_.find(std::string{name});
    return it != timers_.end() && it->second->cancel();
}

auto FrameScheduler::hasArmedTimers() const -> bool {
    for (auto const& [name, timer] : timers_) {
        if (timer->armed()) {
            return true;
        }
    }
    return false;
}

auto FrameScheduler::pollTimers() -> void {
    // Callbacks may add timers; collect the due ones first.
    std::vector<DeadlineTimer*> timers;
    timers.reserve(timers_.size());
    for (auto& [name, timer] : timers_) {
        timers.push_back(timer.get());
    }
    for (auto* timer : timers) {
        timer->poll();
    }
}

auto FrameScheduler::onFrame(double timeMs) -> void {
    pending_.reset();

    std::shared_ptr<Frame const> frame;
    {
        // Cleared on every exit path, including a throwing effect.
        struct RenderingScope {
            bool& flag;
            explicit RenderingScope(bool& f) : flag(f) { flag = true; }
            ~RenderingScope() { flag = false; }
        } scope{rendering_};

        this->pollTimers();
        track_.refreshVirtualization(effects_.rules().loopBuffer);

        frame = freezeFrame(store_.getSnapshot(), timeMs);
        this->renderFrame(*frame);

        store_.markClean();
        ++framesRendered_;
    }
    st_log("Rendered frame at " + std::to_string(timeMs), "FrameScheduler", "Tick");

    if (frame->animation.isRunning) {
        track_.advance(timeMs);
        this->requestFrame();
    } else if (this->hasArmedTimers()) {
        this->requestFrame();
    }
}

auto FrameScheduler::renderFrame(Frame const& frame) -> void {
    bus_->emit(Events::FrameBeforeRender{.time = frame.time});

    if (auto* effect = effects_.current()) {
        Coords::FrameHelpers const helpers{frame};
        effect->render(frame, helpers);
    }

    visibility_ = Coords::computeSlideVisibility(frame.widths, frame.slides, frame.animation.offset);
    if (visibilityPass_) {
        visibilityPass_(frame, visibility_);
    }

    bus_->emit(Events::FrameAfterRender{.time = frame.time});
}

} // namespace ST
