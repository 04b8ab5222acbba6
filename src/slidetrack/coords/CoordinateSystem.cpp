#include <slidetrack/coords/CoordinateSystem.hpp>

#include <slidetrack/track/TrackMath.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace ST::Coords {

namespace {

auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

auto available_points(TransformPoints const& points) -> std::string {
    std::string names;
    for (auto const& point : points.points()) {
        if (!names.empty()) {
            names.append(", ");
        }
        names.append(point.name);
    }
    return names;
}

} // namespace

auto computeTransformPoints(Widths const& widths, int slidesPerView) -> TransformPoints {
    auto const visible = std::max(slidesPerView, 1);
    auto const step    = widths.slideAndGap;
    auto const cl1     = widths.paddingLeft + widths.slide / 2.0;
    auto const cln     = cl1 + step * (visible - 1);

    std::vector<NamedPoint> points;
    points.reserve(static_cast<std::size_t>(visible) * 2 + 1 + kOuterAnchorCount * 2);
    for (int i = 1; i <= visible; ++i) {
        points.push_back({"CL" + std::to_string(i), cl1 + step * (i - 1)});
    }
    for (int i = 1; i <= visible; ++i) {
        points.push_back({"CR" + std::to_string(i), cl1 + step * (visible - i)});
    }
    points.push_back({"C", visible == 1 ? cl1 : (cl1 + cln) / 2.0});
    for (int i = 1; i <= kOuterAnchorCount; ++i) {
        points.push_back({"L" + std::to_string(i), cl1 - step * i});
    }
    for (int i = 1; i <= kOuterAnchorCount; ++i) {
        points.push_back({"R" + std::to_string(i), cln + step * i});
    }
    return TransformPoints{std::move(points)};
}

auto resolvePoint(std::string_view name, TransformPoints const& points, double trackOffset) -> Expected<double> {
    if (name == kLeftInfinity) {
        return -std::numeric_limits<double>::infinity();
    }
    if (name == kRightInfinity) {
        return std::numeric_limits<double>::infinity();
    }
    auto base = points.find(name);
    if (!base) {
        st_log("Unknown point " + std::string{name}, "CoordinateSystem", "ERROR");
        return std::unexpected(make_error(Error::Code::NoSuchPoint,
                                          "unknown point \"" + std::string{name} + "\"; available: " + available_points(points)));
    }
    return *base + trackOffset;
}

auto rangeBetween(std::string_view a, std::string_view b, TransformPoints const& points, double trackOffset) -> Expected<Range> {
    auto first = resolvePoint(a, points, trackOffset);
    if (!first) {
        return std::unexpected(first.error());
    }
    auto second = resolvePoint(b, points, trackOffset);
    if (!second) {
        return std::unexpected(second.error());
    }
    if (*first > *second) {
        return Range{.start = *first, .end = *second};
    }
    return Range{.start = *second, .end = *first};
}

auto testRange(double center, Range const& range) -> RangeHit {
    auto const start   = Track::roundToHalf(range.start);
    auto const end     = Track::roundToHalf(range.end);
    auto const rounded = Track::roundToHalf(center);

    RangeHit hit{.inRange = rounded <= start && rounded > end, .percent = 0.0, .start = start, .end = end};
    if (!hit.inRange) {
        return hit;
    }
    if (std::isfinite(start) && std::isfinite(end)) {
        auto const full = start - end;
        hit.percent     = full > 0.0 ? std::clamp((rounded - end) / full, 0.0, 1.0) : 1.0;
    } else {
        hit.percent = 1.0;
    }
    return hit;
}

FrameHelpers::FrameHelpers(Frame const& frame)
    : frame_(frame)
    , trackOffset_(frame.animation.offset == 0.0 ? 0.0 : -frame.animation.offset) {}

auto FrameHelpers::getPointValue(std::string_view name) const -> Expected<double> {
    return resolvePoint(name, frame_.transformPoints, trackOffset_);
}

auto FrameHelpers::getRange(std::string_view a, std::string_view b) const -> Expected<Range> {
    return rangeBetween(a, b, frame_.transformPoints, trackOffset_);
}

auto FrameHelpers::isInRange(double center, std::string_view a, std::string_view b) const -> Expected<RangeHit> {
    return this->getRange(a, b).transform([center](Range const& range) { return testRange(center, range); });
}

auto FrameHelpers::isSlideInRange(SlideDescriptor const& slide, std::string_view a, std::string_view b) const -> Expected<RangeHit> {
    return this->isInRange(slide.centerPoint, a, b);
}

} // namespace ST::Coords
