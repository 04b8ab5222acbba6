#pragma once
#include <slidetrack/coords/SlideVisibility.hpp>
#include <slidetrack/events/EventBus.hpp>
#include <slidetrack/render/EffectManager.hpp>
#include <slidetrack/render/Frame.hpp>
#include <slidetrack/scheduler/Clock.hpp>
#include <slidetrack/scheduler/DeadlineTimer.hpp>
#include <slidetrack/scheduler/FrameHost.hpp>
#include <slidetrack/store/ReactiveStore.hpp>
#include <slidetrack/track/TrackCoordinator.hpp>

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ST {

enum class SchedulerState : std::uint8_t {
    Idle,
    Scheduled,
    Rendering,
};

using VisibilityPass = std::function<void(Frame const&, std::vector<Coords::SlideVisibility> const&)>;

/**
 * Runs one render pass per host tick.
 *
 * A pass fires due timers, refreshes virtualisation, freezes a Frame from a
 * store snapshot, emits FrameBeforeRender, calls the active effect, runs the
 * visibility pass, emits FrameAfterRender and marks the store clean. While
 * the animation is running it then advances the motion and schedules the next
 * tick. StoreDirty and EffectChanged request frames; requests made while a
 * pass is rendering are absorbed by that pass.
 */
class FrameScheduler {
public:
    FrameScheduler(ReactiveStore& store,
                   TrackCoordinator& track,
                   EffectManager& effects,
                   std::shared_ptr<EventBus> bus,
                   FrameHost& host,
                   Clock const& clock);
    ~FrameScheduler();

    FrameScheduler(FrameScheduler const&)                    = delete;
    auto operator=(FrameScheduler const&) -> FrameScheduler& = delete;

    auto requestFrame() -> void;
    auto cancel() -> void;
    auto onFrame(double timeMs) -> void;

    auto setVisibilityPass(VisibilityPass pass) -> void;

    // Runs `fn` once `delay` has passed since the latest call with the same name.
    auto debounce(std::string const& name, std::chrono::milliseconds delay, std::function<void()> fn) -> void;
    auto cancelTimer(std::string_view name) -> bool;
    [[nodiscard]] auto hasArmedTimers() const -> bool;

    [[nodiscard]] auto state() const -> SchedulerState;
    [[nodiscard]] auto framesRendered() const -> std::uint64_t { return framesRendered_; }
    [[nodiscard]] auto lastVisibility() const -> std::vector<Coords::SlideVisibility> const& { return visibility_; }

private:
    auto pollTimers() -> void;
    auto renderFrame(Frame const& frame) -> void;

    ReactiveStore&                       store_;
    TrackCoordinator&                    track_;
    EffectManager&                       effects_;
    std::shared_ptr<EventBus>            bus_;
    FrameHost&                           host_;
    Clock const&                         clock_;
    std::optional<FrameRequestId>        pending_;
    bool                                 rendering_      = false;
    std::uint64_t                        framesRendered_ = 0;
    VisibilityPass                       visibilityPass_;
    std::vector<Coords::SlideVisibility> visibility_;
    std::vector<SubscriptionId>          subscriptions_;

    phmap::flat_hash_map<std::string, std::unique_ptr<DeadlineTimer>> timers_;
};

} // namespace ST
