#pragma once
#include <slidetrack/store/StateSlices.hpp>

#include <optional>

// Pure index/offset arithmetic shared by the track coordinator and the facade.
// Offsets are track translations: moving forward makes them more negative.
namespace ST::Track {

inline constexpr double kDefaultLaunchVelocity = 15.0;
inline constexpr double kVelocityBoost         = 1.2;
inline constexpr double kLowVelocityBoost      = 1.3;
inline constexpr double kRightEdgeEpsilon      = 0.1;

// Host-supplied layout in absolute units. Without `slide` the slide width is
// derived from the viewport and the number of slides per view.
struct LayoutMetrics {
    double                viewport     = 0.0;
    double                gap          = 0.0;
    double                paddingLeft  = 0.0;
    double                paddingRight = 0.0;
    double                slideMin     = 0.0;
    std::optional<double> slide;

    auto operator==(LayoutMetrics const&) const -> bool = default;
};

[[nodiscard]] auto roundToHalf(double value) -> double;

[[nodiscard]] auto roundToThousandth(double value) -> double;

// track = slideCount * (slide + gap); the trailing gap keeps the loop seamless.
[[nodiscard]] auto computeWidths(LayoutMetrics const& layout, int slideCount, int slidesPerView) -> Widths;

[[nodiscard]] auto canLoop(int slideCount, Options const& options) -> bool;

[[nodiscard]] auto trackOffsetForIndex(int index, Widths const& widths, Options const& options, bool looping) -> double;

// Nearest slide whose resting offset matches `offset`, clamped to [0, slideCount).
[[nodiscard]] auto indexForTrackOffset(double offset, Widths const& widths, int slideCount) -> int;

// Picks the loop-equivalent target with the shortest travel from `current`.
// An exact half-track tie is broken by velocity sign: negative or absent
// moves forward, positive moves backward.
[[nodiscard]] auto resolveLoopTarget(double current, double target, double trackLength, std::optional<double> velocity) -> double;

// ±15 toward the target when absent, otherwise boosted.
[[nodiscard]] auto resolveLaunchVelocity(double current, double target, std::optional<double> velocity) -> double;

[[nodiscard]] auto directionOf(double current, double target) -> int;

[[nodiscard]] auto pageCount(int slideCount, Options const& options) -> int;
[[nodiscard]] auto pageForSlide(int index, Options const& options) -> int;

} // namespace ST::Track
