#pragma once
#include <slidetrack/store/StateSlices.hpp>

#include <optional>
#include <string>
#include <string_view>

// Event payloads carried on the EventBus. Each payload names itself through
// `kName`, which is what the bus logs and the JSON traces record.
namespace ST::Events {

template <typename T>
struct Change {
    T prev;
    T current;
};

struct OptionsChanged : Change<Options> {
    static constexpr std::string_view kName = "store:options-changed";
};
struct StateChanged : Change<RuntimeState> {
    static constexpr std::string_view kName = "store:state-changed";
};
struct LayoutChanged : Change<Widths> {
    static constexpr std::string_view kName = "store:layout-changed";
};
struct SlidesChanged : Change<std::vector<SlideDescriptor>> {
    static constexpr std::string_view kName = "store:slides-changed";
};
struct TransformPointsChanged : Change<TransformPoints> {
    static constexpr std::string_view kName = "store:transform-points-changed";
};
struct AnimationChanged : Change<AnimationDescriptor> {
    static constexpr std::string_view kName = "store:animation-changed";
};

struct SelectedIndexChanged : Change<int> {
    static constexpr std::string_view kName = "store:selected-index-changed";
};
struct RenderIndexChanged : Change<int> {
    static constexpr std::string_view kName = "store:render-index-changed";
};
struct PageIndexChanged : Change<int> {
    static constexpr std::string_view kName = "store:page-index-changed";
};
struct PageCountChanged {
    static constexpr std::string_view kName = "store:page-count-changed";
    int count = 1;
};
struct TrackPositionChanged : Change<double> {
    static constexpr std::string_view kName = "store:track-position-changed";
};

struct StoreDirty {
    static constexpr std::string_view kName = "store:dirty";
};
struct StoreClean {
    static constexpr std::string_view kName = "store:clean";
};

// Exactly one of `index` and `trackPosition` is set.
struct AnimationRequested {
    static constexpr std::string_view kName = "animation:requested";
    std::optional<int>    index;
    std::optional<double> trackPosition;
    std::optional<double> velocity;
    AnimationType         type = AnimationType::Animated;
};

struct PositionChanged {
    static constexpr std::string_view kName = "motion:position-changed";
    double position = 0.0;
    double delta    = 0.0;
    double progress = 0.0;
    double velocity = 0.0;
};

struct MotionFinished {
    static constexpr std::string_view kName = "motion:finished";
    double finalPosition = 0.0;
};

struct TrackShifted {
    static constexpr std::string_view kName = "track:shifted";
    double rebaseDelta   = 0.0;
    double trackPosition = 0.0;
};

// Raised when a drag released past the threshold should move one page.
struct PageStepRequested {
    static constexpr std::string_view kName = "track:page-step-requested";
    int                   step = 1;
    std::optional<double> velocity;
};

struct DragStarted {
    static constexpr std::string_view kName = "drag:started";
};
struct DragMoved {
    static constexpr std::string_view kName = "drag:moved";
    double delta = 0.0;
};
struct DragEnded {
    static constexpr std::string_view kName = "drag:ended";
    double                delta = 0.0;
    std::optional<double> velocity;
};

struct EffectLoaded {
    static constexpr std::string_view kName = "effect:loaded";
    std::string name;
};
struct EffectChanged {
    static constexpr std::string_view kName = "effect:changed";
    std::string previousName;
    std::string currentName;
};
struct EffectDestroyed {
    static constexpr std::string_view kName = "effect:destroyed";
    std::string name;
};

struct FrameBeforeRender {
    static constexpr std::string_view kName = "frame:before-render";
    double time = 0.0;
};
struct FrameAfterRender {
    static constexpr std::string_view kName = "frame:after-render";
    double time = 0.0;
};

} // namespace ST::Events
