#pragma once
#include <slidetrack/core/Error.hpp>
#include <slidetrack/render/Frame.hpp>
#include <slidetrack/store/StateSlices.hpp>

#include <string_view>

namespace ST::Coords {

inline constexpr int kOuterAnchorCount = 10;

// Sentinels resolving to -infinity and +infinity.
inline constexpr std::string_view kLeftInfinity  = "L+";
inline constexpr std::string_view kRightInfinity = "R+";

/**
 * Named anchors in viewport space, computed from layout:
 *   CL1..CLn  centre of each visible slide at rest, left to right
 *   CR1..CRn  the same anchors mirrored right to left
 *   C         midpoint of CL1 and CLn
 *   L1..L10   one slide step further left of CL1 each
 *   R1..R10   one slide step further right of CLn each
 */
[[nodiscard]] auto computeTransformPoints(Widths const& widths, int slidesPerView) -> TransformPoints;

struct Range {
    double start = 0.0; // the larger end
    double end   = 0.0;
};

struct RangeHit {
    bool   inRange = false;
    double percent = 0.0;
    double start   = 0.0;
    double end     = 0.0;
};

[[nodiscard]] auto resolvePoint(std::string_view name, TransformPoints const& points, double trackOffset) -> Expected<double>;
[[nodiscard]] auto rangeBetween(std::string_view a, std::string_view b, TransformPoints const& points, double trackOffset) -> Expected<Range>;

// `low < centre <= high` after rounding everything to the nearest half unit.
[[nodiscard]] auto testRange(double center, Range const& range) -> RangeHit;

/**
 * Coordinate helpers bound to one frame. `trackOffset()` is the negated
 * animation offset, so point values move with the track.
 */
class FrameHelpers {
public:
    explicit FrameHelpers(Frame const& frame);

    [[nodiscard]] auto getPointValue(std::string_view name) const -> Expected<double>;
    [[nodiscard]] auto getRange(std::string_view a, std::string_view b) const -> Expected<Range>;
    [[nodiscard]] auto isInRange(double center, std::string_view a, std::string_view b) const -> Expected<RangeHit>;
    [[nodiscard]] auto isSlideInRange(SlideDescriptor const& slide, std::string_view a, std::string_view b) const -> Expected<RangeHit>;

    [[nodiscard]] auto trackOffset() const -> double { return trackOffset_; }
    [[nodiscard]] auto transformPoints() const -> TransformPoints const& { return frame_.transformPoints; }
    [[nodiscard]] auto frame() const -> Frame const& { return frame_; }

private:
    Frame const& frame_;
    double       trackOffset_;
};

} // namespace ST::Coords
