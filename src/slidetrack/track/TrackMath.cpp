#include <slidetrack/track/TrackMath.hpp>

#include <algorithm>
#include <cmath>

namespace ST::Track {

// Ties round toward positive infinity in both helpers.
auto roundToHalf(double value) -> double {
    return std::floor(value * 2.0 + 0.5) / 2.0;
}

auto roundToThousandth(double value) -> double {
    return std::floor(value * 1000.0 + 0.5) / 1000.0;
}

auto computeWidths(LayoutMetrics const& layout, int slideCount, int slidesPerView) -> Widths {
    auto const perView = std::max(slidesPerView, 1);

    double slide = 0.0;
    if (layout.slide) {
        slide = std::max(*layout.slide, 0.0);
    } else {
        auto const available = std::max(0.0, layout.viewport - layout.gap * (perView - 1) - layout.paddingLeft - layout.paddingRight);
        slide                = roundToThousandth(available / perView);
    }
    if (slide < layout.slideMin) {
        slide = layout.slideMin;
    }

    return Widths{
        .viewport     = layout.viewport,
        .track        = std::max(slideCount, 0) * (slide + layout.gap),
        .slide        = slide,
        .slideMin     = layout.slideMin,
        .gap          = layout.gap,
        .slideAndGap  = roundToThousandth(slide + layout.gap),
        .paddingLeft  = layout.paddingLeft,
        .paddingRight = layout.paddingRight,
    };
}

auto canLoop(int slideCount, Options const& options) -> bool {
    return options.loop && slideCount > options.slidesPerView;
}

auto trackOffsetForIndex(int index, Widths const& widths, Options const& options, bool looping) -> double {
    auto       pos    = index * (widths.slide + widths.gap);
    auto const minPos = -widths.paddingLeft;
    auto const maxPos = widths.track - widths.viewport - widths.gap + widths.paddingRight - kRightEdgeEpsilon;

    if (pos != minPos && pos != maxPos && options.centerSelectedSlide) {
        pos -= widths.viewport / 2.0;
        pos += widths.slide / 2.0;
    } else {
        pos -= widths.paddingLeft;
    }

    if (!looping) {
        if (pos < 0.0) {
            pos = minPos;
        }
        if (pos > maxPos) {
            pos = maxPos;
        }
    }
    return pos == 0.0 ? 0.0 : -pos;
}

auto indexForTrackOffset(double offset, Widths const& widths, int slideCount) -> int {
    if (slideCount <= 0 || widths.slideAndGap <= 0.0) {
        return 0;
    }
    auto const pos   = -offset + widths.paddingLeft;
    auto const index = static_cast<int>(std::lround(pos / widths.slideAndGap));
    return std::clamp(index, 0, slideCount - 1);
}

auto resolveLoopTarget(double current, double target, double trackLength, std::optional<double> velocity) -> double {
    auto const distance = std::abs(current - target);
    auto const half     = trackLength / 2.0;

    if (distance == half) {
        if (velocity && *velocity != 0.0) {
            if (*velocity < 0.0) {
                if (target > current) {
                    target -= trackLength;
                }
            } else if (target <= current) {
                target += trackLength;
            }
        } else if (target > current) {
            target -= trackLength;
        }
    } else if (distance > half) {
        target += target >= current ? -trackLength : trackLength;
    }
    return target;
}

auto resolveLaunchVelocity(double current, double target, std::optional<double> velocity) -> double {
    if (!velocity) {
        return target < current ? -kDefaultLaunchVelocity : kDefaultLaunchVelocity;
    }
    auto boosted = *velocity * kVelocityBoost;
    if (std::abs(boosted) < kDefaultLaunchVelocity) {
        boosted *= kLowVelocityBoost;
    }
    return boosted;
}

auto directionOf(double current, double target) -> int {
    if (target < current) {
        return -1;
    }
    if (target > current) {
        return 1;
    }
    return 0;
}

auto pageCount(int slideCount, Options const& options) -> int {
    auto const perMove = std::max(options.slidesPerMove, 1);
    if (options.loop) {
        return std::max(1, (slideCount + perMove - 1) / perMove);
    }
    if (slideCount <= options.slidesPerView) {
        return 1;
    }
    auto const remaining = slideCount - options.slidesPerView;
    return (remaining + perMove - 1) / perMove + 1;
}

auto pageForSlide(int index, Options const& options) -> int {
    return index / std::max(options.slidesPerMove, 1);
}

} // namespace ST::Track
