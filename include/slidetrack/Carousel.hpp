#pragma once
#include <slidetrack/core/Error.hpp>
#include <slidetrack/events/EventBus.hpp>
#include <slidetrack/render/EffectManager.hpp>
#include <slidetrack/render/EffectRegistry.hpp>
#include <slidetrack/scheduler/Clock.hpp>
#include <slidetrack/scheduler/FrameHost.hpp>
#include <slidetrack/scheduler/FrameScheduler.hpp>
#include <slidetrack/store/ReactiveStore.hpp>
#include <slidetrack/track/TrackCoordinator.hpp>
#include <slidetrack/track/TrackMath.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace ST {

/**
 * Headless carousel: wires the store, track coordinator, effect manager and
 * frame scheduler around one event bus and exposes the navigation commands.
 *
 * Commands never touch the motion directly; they update the store and emit
 * `Events::AnimationRequested`, which the track coordinator resolves.
 */
class Carousel {
public:
    static constexpr std::chrono::milliseconds kLayoutDebounce{4};
    static constexpr double                    kEdgeNudgeVelocity = 10.0;

    // `host`, `clock` and `registry` must outlive the carousel. Invalid options
    // throw RangeError (animation coefficients) or ConfigurationError.
    Carousel(FrameHost& host, Clock const& clock, EffectRegistry const& registry, OptionsPatch const& options = {});
    ~Carousel();

    Carousel(Carousel const&)                    = delete;
    auto operator=(Carousel const&) -> Carousel& = delete;

    // Slides
    auto setSlideCount(int count) -> void;
    auto addSlide(std::optional<int> at = std::nullopt) -> Expected<void>;
    auto removeSlide(int index) -> Expected<void>;

    // Layout
    auto setLayout(Track::LayoutMetrics const& layout) -> void;
    auto scheduleLayout(Track::LayoutMetrics const& layout) -> void;

    // Navigation
    auto next(double velocity = 0.0) -> void;
    auto prev(double velocity = 0.0) -> void;
    auto goToSlide(int index, double velocity = 0.0) -> void;
    auto jumpToSlide(int index) -> Expected<void>;
    auto goToPage(int page, double velocity = 0.0) -> void;
    auto jumpToPage(int page) -> Expected<void>;
    // 0 to 100 percent of the offset of the last page; applied instantly.
    auto requestTrackPosition(double percent) -> void;
    auto setSelectedIndex(int index) -> Expected<void>;
    auto updateOptions(OptionsPatch const& patch) -> Expected<void>;

    [[nodiscard]] auto getIndex() const -> int { return store_.getState().renderIndex; }
    [[nodiscard]] auto getPage() const -> int { return store_.getState().pageIndex; }
    [[nodiscard]] auto getSelectedIndex() const -> int { return store_.getState().selectedIndex; }
    [[nodiscard]] auto state() const -> RuntimeState { return store_.getState(); }
    [[nodiscard]] auto options() const -> Options { return store_.getOptions(); }
    [[nodiscard]] auto slides() const -> std::vector<SlideDescriptor> { return store_.getSlides(); }
    [[nodiscard]] auto layout() const -> Track::LayoutMetrics const& { return layout_; }

    template <typename Event>
    auto on(std::function<void(Event const&)> handler) -> SubscriptionId {
        return bus_->on<Event>(std::move(handler));
    }
    auto off(SubscriptionId id) -> bool { return bus_->off(id); }

    [[nodiscard]] auto bus() -> EventBus& { return *bus_; }
    [[nodiscard]] auto store() -> ReactiveStore& { return store_; }
    [[nodiscard]] auto track() -> TrackCoordinator& { return track_; }
    [[nodiscard]] auto effects() -> EffectManager& { return effects_; }
    [[nodiscard]] auto scheduler() -> FrameScheduler& { return scheduler_; }

private:
    auto bindCoreEvents() -> void;
    auto recomputeLayout(Options const& options) -> void;
    auto rebuildSlides(int count) -> void;
    auto renderSelection(int selectedIndex) -> void;
    auto restoreIndex() -> void;
    [[nodiscard]] auto percentToTrackOffset(double percent) const -> double;

    std::shared_ptr<EventBus>   bus_;
    ReactiveStore               store_;
    EffectManager               effects_;
    TrackCoordinator            track_;
    FrameScheduler              scheduler_;
    Track::LayoutMetrics        layout_;
    std::vector<SubscriptionId> subscriptions_;
};

} // namespace ST
