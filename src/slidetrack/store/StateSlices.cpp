#include <slidetrack/store/StateSlices.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace ST {

namespace {

auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

auto in_open_unit_interval(double value) -> bool {
    return value > 0.0 && value < 1.0;
}

template <typename T>
auto assign_if(T& target, std::optional<T> const& value) -> void {
    if (value) {
        target = *value;
    }
}

} // namespace

auto animationTypeName(AnimationType type) -> std::string_view {
    switch (type) {
    case AnimationType::Instant:
        return "instant";
    case AnimationType::Animated:
        return "animated";
    case AnimationType::Settling:
        return "settling";
    case AnimationType::Dragging:
        return "dragging";
    }
    return "instant";
}

auto parseAnimationType(std::string_view name) -> std::optional<AnimationType> {
    if (name == "instant" || name == "jump")
        return AnimationType::Instant;
    if (name == "animated" || name == "animate")
        return AnimationType::Animated;
    if (name == "settling" || name == "settle")
        return AnimationType::Settling;
    if (name == "dragging" || name == "drag")
        return AnimationType::Dragging;
    return std::nullopt;
}

TransformPoints::TransformPoints(std::vector<NamedPoint> points)
    : points_(std::move(points)) {}

auto TransformPoints::find(std::string_view name) const -> std::optional<double> {
    auto it = std::ranges::find(points_, name, &NamedPoint::name);
    if (it == points_.end()) {
        return std::nullopt;
    }
    return it->value;
}

auto TransformPoints::set(std::string name, double value) -> void {
    auto it = std::ranges::find(points_, name, &NamedPoint::name);
    if (it != points_.end()) {
        it->value = value;
        return;
    }
    points_.push_back(NamedPoint{std::move(name), value});
}

auto merge(Options base, OptionsPatch const& patch) -> Options {
    assign_if(base.loop, patch.loop);
    assign_if(base.slidesPerView, patch.slidesPerView);
    assign_if(base.slidesPerMove, patch.slidesPerMove);
    assign_if(base.centerSelectedSlide, patch.centerSelectedSlide);
    assign_if(base.goToSelectedSlide, patch.goToSelectedSlide);
    assign_if(base.dragThreshold, patch.dragThreshold);
    assign_if(base.initialIndex, patch.initialIndex);
    assign_if(base.effect, patch.effect);
    assign_if(base.attraction, patch.attraction);
    assign_if(base.friction, patch.friction);
    return base;
}

auto validateOptions(Options const& options) -> Expected<void> {
    if (options.slidesPerView < 1) {
        return std::unexpected(make_error(Error::Code::InvalidArgument, "slidesPerView must be at least 1"));
    }
    if (options.slidesPerMove < 1) {
        return std::unexpected(make_error(Error::Code::InvalidArgument, "slidesPerMove must be at least 1"));
    }
    if (!std::isfinite(options.dragThreshold) || options.dragThreshold < 0.0) {
        return std::unexpected(make_error(Error::Code::InvalidArgument, "dragThreshold must be a non-negative number"));
    }
    if (options.initialIndex < 0) {
        return std::unexpected(make_error(Error::Code::InvalidArgument, "initialIndex must not be negative"));
    }
    if (options.effect.empty()) {
        return std::unexpected(make_error(Error::Code::InvalidArgument, "effect name must not be empty"));
    }
    if (!in_open_unit_interval(options.attraction)) {
        return std::unexpected(make_error(Error::Code::OutOfBounds, "attraction must lie in (0, 1)"));
    }
    if (!in_open_unit_interval(options.friction)) {
        return std::unexpected(make_error(Error::Code::OutOfBounds, "friction must lie in (0, 1)"));
    }
    return {};
}

auto merge(RuntimeState base, RuntimeStatePatch const& patch) -> RuntimeState {
    assign_if(base.selectedIndex, patch.selectedIndex);
    assign_if(base.renderIndex, patch.renderIndex);
    assign_if(base.pageIndex, patch.pageIndex);
    assign_if(base.pageCount, patch.pageCount);
    assign_if(base.isDragging, patch.isDragging);
    assign_if(base.slideCount, patch.slideCount);
    return base;
}

auto merge(AnimationDescriptor base, AnimationPatch const& patch) -> AnimationDescriptor {
    assign_if(base.type, patch.type);
    assign_if(base.offset, patch.offset);
    assign_if(base.delta, patch.delta);
    assign_if(base.velocity, patch.velocity);
    assign_if(base.progress, patch.progress);
    assign_if(base.isRunning, patch.isRunning);
    assign_if(base.direction, patch.direction);
    return base;
}

} // namespace ST
