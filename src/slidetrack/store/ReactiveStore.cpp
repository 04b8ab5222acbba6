#include <slidetrack/store/ReactiveStore.hpp>

#include <slidetrack/events/Events.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace ST {

namespace {

auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

// Fine-grained events fire only for fields present in the patch whose value moved.
template <typename Event>
auto emit_if_changed(EventBus& bus, std::optional<int> const& requested, int prev, int current) -> void {
    if (requested && prev != current) {
        bus.emit(Event{{prev, current}});
    }
}

} // namespace

ReactiveStore::ReactiveStore(std::shared_ptr<EventBus> bus)
    : bus_(std::move(bus)) {
    if (!bus_) {
        throw ConfigurationError("ReactiveStore requires an event bus");
    }
}

auto ReactiveStore::getSnapshot() const -> StoreSnapshot {
    return StoreSnapshot{
        .options         = options_,
        .state           = state_,
        .widths          = widths_,
        .slides          = slides_,
        .transformPoints = transformPoints_,
        .animation       = animation_,
    };
}

auto ReactiveStore::setOptions(OptionsPatch const& patch) -> void {
    auto prev = options_;
    options_  = merge(options_, patch);
    this->markDirty();
    bus_->emit(Events::OptionsChanged{{prev, options_}});
}

auto ReactiveStore::setState(RuntimeStatePatch const& patch) -> void {
    auto prev = state_;
    state_    = merge(state_, patch);
    this->markDirty();
    bus_->emit(Events::StateChanged{{prev, state_}});

    emit_if_changed<Events::SelectedIndexChanged>(*bus_, patch.selectedIndex, prev.selectedIndex, state_.selectedIndex);
    emit_if_changed<Events::RenderIndexChanged>(*bus_, patch.renderIndex, prev.renderIndex, state_.renderIndex);
    emit_if_changed<Events::PageIndexChanged>(*bus_, patch.pageIndex, prev.pageIndex, state_.pageIndex);
    if (patch.pageCount && prev.pageCount != state_.pageCount) {
        bus_->emit(Events::PageCountChanged{.count = state_.pageCount});
    }
}

auto ReactiveStore::setWidths(Widths const& widths) -> void {
    auto prev = widths_;
    widths_   = widths;
    this->markDirty();
    bus_->emit(Events::LayoutChanged{{prev, widths_}});
}

auto ReactiveStore::setSlides(std::vector<SlideDescriptor> slides) -> void {
    auto count = static_cast<int>(slides.size());
    this->setState(RuntimeStatePatch{.slideCount = count});

    auto prev = std::move(slides_);
    slides_   = std::move(slides);
    this->markDirty();
    bus_->emit(Events::SlidesChanged{{std::move(prev), slides_}});
}

auto ReactiveStore::setTransformPoints(TransformPoints points) -> void {
    auto prev        = std::move(transformPoints_);
    transformPoints_ = std::move(points);
    this->markDirty();
    bus_->emit(Events::TransformPointsChanged{{std::move(prev), transformPoints_}});
}

auto ReactiveStore::setAnimation(AnimationPatch const& patch) -> void {
    auto prev  = animation_;
    animation_ = merge(animation_, patch);
    this->markDirty();
    bus_->emit(Events::AnimationChanged{{prev, animation_}});
    if (patch.offset && prev.offset != animation_.offset) {
        bus_->emit(Events::TrackPositionChanged{{prev.offset, animation_.offset}});
    }
}

auto ReactiveStore::setSlidePositions(std::span<SlidePosition const> positions) -> Expected<void> {
    if (positions.size() != slides_.size()) {
        st_log("Slide position count " + std::to_string(positions.size()) + " does not match "
                   + std::to_string(slides_.size()) + " slides",
               "ReactiveStore", "ERROR");
        return std::unexpected(make_error(Error::Code::MalformedInput, "slide position count mismatch"));
    }
    auto prev = slides_;
    for (std::size_t i = 0; i < positions.size(); ++i) {
        slides_[i].renderIndex   = positions[i].renderIndex;
        slides_[i].trackPosition = positions[i].trackPosition;
        slides_[i].centerPoint   = positions[i].centerPoint;
    }
    this->markDirty();
    bus_->emit(Events::SlidesChanged{{std::move(prev), slides_}});
    return {};
}

auto ReactiveStore::markDirty() -> void {
    ++revision_;
    if (dirty_) {
        return;
    }
    dirty_ = true;
    bus_->emit(Events::StoreDirty{});
}

auto ReactiveStore::markClean() -> void {
    if (!dirty_) {
        return;
    }
    dirty_ = false;
    bus_->emit(Events::StoreClean{});
}

} // namespace ST
