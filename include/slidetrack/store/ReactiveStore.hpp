#pragma once
#include <slidetrack/core/Error.hpp>
#include <slidetrack/events/EventBus.hpp>
#include <slidetrack/store/StateSlices.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace ST {

/**
 * Single source of truth for carousel state.
 *
 * Getters return copies. Every mutator marks the store dirty, even when the
 * patch leaves the values unchanged, bumps `revision()` and emits a
 * `{prev, current}` change event for its slice. `StoreDirty` is emitted only on
 * the clean to dirty transition; `markClean()` emits `StoreClean` only when
 * the store was dirty.
 */
class ReactiveStore {
public:
    explicit ReactiveStore(std::shared_ptr<EventBus> bus);

    ReactiveStore(ReactiveStore const&)                    = delete;
    auto operator=(ReactiveStore const&) -> ReactiveStore& = delete;

    [[nodiscard]] auto getOptions() const -> Options { return options_; }
    [[nodiscard]] auto getState() const -> RuntimeState { return state_; }
    [[nodiscard]] auto getWidths() const -> Widths { return widths_; }
    [[nodiscard]] auto getSlides() const -> std::vector<SlideDescriptor> { return slides_; }
    [[nodiscard]] auto getTransformPoints() const -> TransformPoints { return transformPoints_; }
    [[nodiscard]] auto getAnimation() const -> AnimationDescriptor { return animation_; }
    [[nodiscard]] auto getSnapshot() const -> StoreSnapshot;

    auto setOptions(OptionsPatch const& patch) -> void;
    auto setState(RuntimeStatePatch const& patch) -> void;
    auto setWidths(Widths const& widths) -> void;
    auto setSlides(std::vector<SlideDescriptor> slides) -> void;
    auto setTransformPoints(TransformPoints points) -> void;
    auto setAnimation(AnimationPatch const& patch) -> void;

    // Replaces the render index, track position and centre of each slide, in order.
    auto setSlidePositions(std::span<SlidePosition const> positions) -> Expected<void>;

    [[nodiscard]] auto isDirty() const -> bool { return dirty_; }
    [[nodiscard]] auto revision() const -> std::uint64_t { return revision_; }
    auto               markClean() -> void;

    [[nodiscard]] auto bus() const -> std::shared_ptr<EventBus> const& { return bus_; }

private:
    auto markDirty() -> void;

    std::shared_ptr<EventBus>    bus_;
    Options                      options_;
    RuntimeState                 state_;
    Widths                       widths_;
    std::vector<SlideDescriptor> slides_;
    TransformPoints              transformPoints_;
    AnimationDescriptor          animation_;
    bool                         dirty_    = false;
    std::uint64_t                revision_ = 0;
};

} // namespace ST
