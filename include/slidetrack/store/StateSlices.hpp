#pragma once
#include <slidetrack/core/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ST {

enum class AnimationType : std::uint8_t {
    Instant,
    Animated,
    Settling,
    Dragging,
};

[[nodiscard]] auto animationTypeName(AnimationType type) -> std::string_view;
[[nodiscard]] auto parseAnimationType(std::string_view name) -> std::optional<AnimationType>;

struct Options {
    bool        loop                = false;
    int         slidesPerView       = 1;
    int         slidesPerMove       = 1;
    bool        centerSelectedSlide = false;
    bool        goToSelectedSlide   = false;
    double      dragThreshold       = 40.0;
    int         initialIndex        = 0;
    std::string effect              = "carousel";
    double      attraction          = 0.026;
    double      friction            = 0.24;

    auto operator==(Options const&) const -> bool = default;
};

struct OptionsPatch {
    std::optional<bool>        loop;
    std::optional<int>         slidesPerView;
    std::optional<int>         slidesPerMove;
    std::optional<bool>        centerSelectedSlide;
    std::optional<bool>        goToSelectedSlide;
    std::optional<double>      dragThreshold;
    std::optional<int>         initialIndex;
    std::optional<std::string> effect;
    std::optional<double>      attraction;
    std::optional<double>      friction;
};

struct RuntimeState {
    int  selectedIndex = 0;
    int  renderIndex   = 0;
    int  pageIndex     = 0;
    int  pageCount     = 1;
    bool isDragging    = false;
    int  slideCount    = 0;

    auto operator==(RuntimeState const&) const -> bool = default;
};

struct RuntimeStatePatch {
    std::optional<int>  selectedIndex;
    std::optional<int>  renderIndex;
    std::optional<int>  pageIndex;
    std::optional<int>  pageCount;
    std::optional<bool> isDragging;
    std::optional<int>  slideCount;
};

// Resolved layout in absolute units. `track` is the loop period.
struct Widths {
    double viewport     = 0.0;
    double track        = 0.0;
    double slide        = 0.0;
    double slideMin     = 0.0;
    double gap          = 0.0;
    double slideAndGap  = 0.0;
    double paddingLeft  = 0.0;
    double paddingRight = 0.0;

    auto operator==(Widths const&) const -> bool = default;
};

struct SlideDescriptor {
    int    logicalIndex  = 0;
    int    renderIndex   = 0;
    double trackPosition = 0.0;
    double centerPoint   = 0.0;
    bool   selected      = false;

    auto operator==(SlideDescriptor const&) const -> bool = default;
};

// Positional part of a slide descriptor, written once per frame by virtualisation.
struct SlidePosition {
    int    renderIndex   = 0;
    double trackPosition = 0.0;
    double centerPoint   = 0.0;

    auto operator==(SlidePosition const&) const -> bool = default;
};

struct NamedPoint {
    std::string name;
    double      value = 0.0;

    auto operator==(NamedPoint const&) const -> bool = default;
};

class TransformPoints {
public:
    TransformPoints() = default;
    explicit TransformPoints(std::vector<NamedPoint> points);

    [[nodiscard]] auto find(std::string_view name) const -> std::optional<double>;
    auto               set(std::string name, double value) -> void;

    [[nodiscard]] auto points() const -> std::vector<NamedPoint> const& { return points_; }
    [[nodiscard]] auto size() const -> std::size_t { return points_.size(); }
    [[nodiscard]] auto empty() const -> bool { return points_.empty(); }

    auto operator==(TransformPoints const&) const -> bool = default;

private:
    std::vector<NamedPoint> points_;
};

struct AnimationDescriptor {
    AnimationType type      = AnimationType::Instant;
    double        offset    = 0.0;
    double        delta     = 0.0;
    double        velocity  = 0.0;
    double        progress  = 1.0;
    bool          isRunning = false;
    int           direction = 0;

    auto operator==(AnimationDescriptor const&) const -> bool = default;
};

struct AnimationPatch {
    std::optional<AnimationType> type;
    std::optional<double>        offset;
    std::optional<double>        delta;
    std::optional<double>        velocity;
    std::optional<double>        progress;
    std::optional<bool>          isRunning;
    std::optional<int>           direction;
};

struct StoreSnapshot {
    Options                      options;
    RuntimeState                 state;
    Widths                       widths;
    std::vector<SlideDescriptor> slides;
    TransformPoints              transformPoints;
    AnimationDescriptor          animation;
};

[[nodiscard]] auto merge(Options base, OptionsPatch const& patch) -> Options;
// Rejects option values the motion and layout code cannot work with.
[[nodiscard]] auto validateOptions(Options const& options) -> Expected<void>;
[[nodiscard]] auto merge(RuntimeState base, RuntimeStatePatch const& patch) -> RuntimeState;
[[nodiscard]] auto merge(AnimationDescriptor base, AnimationPatch const& patch) -> AnimationDescriptor;

} // namespace ST
