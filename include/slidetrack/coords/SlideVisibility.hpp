#pragma once
#include <slidetrack/store/StateSlices.hpp>

#include <vector>

namespace ST::Coords {

inline constexpr double kFullyVisibleThreshold = 0.66;

// Per-slide viewport metrics. Visibility fractions lie in [0, 1], parallax in [-1, 1].
struct SlideVisibility {
    int    logicalIndex       = 0;
    int    renderIndex        = 0;
    double visibilityPercent  = 0.0;
    bool   isVisible          = false;
    bool   isFullyVisible     = false;
    double leftVisibility     = 0.0;
    double rightVisibility    = 0.0;
    double parallax           = 0.0;
    double parallaxVisibility = 1.0;
    double slideStart         = 0.0;
    double slideEnd           = 0.0;
};

[[nodiscard]] auto computeSlideVisibility(Widths const& widths,
                                          std::vector<SlideDescriptor> const& slides,
                                          double trackOffset,
                                          double buffer = 0.0) -> std::vector<SlideVisibility>;

} // namespace ST::Coords
