#include <slidetrack/coords/SlideVisibility.hpp>

#include <algorithm>

namespace ST::Coords {

auto computeSlideVisibility(Widths const& widths,
                            std::vector<SlideDescriptor> const& slides,
                            double trackOffset,
                            double buffer) -> std::vector<SlideVisibility> {
    std::vector<SlideVisibility> result;
    result.reserve(slides.size());

    auto const viewStart  = -trackOffset - buffer;
    auto const viewEnd    = viewStart + widths.viewport + buffer * 2.0;
    auto const viewCenter = -trackOffset + widths.viewport / 2.0;
    auto const halfView   = widths.viewport / 2.0;

    for (auto const& slide : slides) {
        SlideVisibility info;
        info.logicalIndex = slide.logicalIndex;
        info.renderIndex  = slide.renderIndex;
        info.slideStart   = slide.renderIndex * widths.slideAndGap;
        info.slideEnd     = info.slideStart + widths.slide;

        auto const intersection = std::max(0.0, std::min(info.slideEnd, viewEnd) - std::max(info.slideStart, viewStart));
        info.visibilityPercent  = widths.slide > 0.0 ? std::clamp(intersection / widths.slide, 0.0, 1.0) : 0.0;
        info.isVisible          = info.visibilityPercent > 0.0;
        info.isFullyVisible     = info.visibilityPercent >= kFullyVisibleThreshold;

        auto const distance = info.slideStart + widths.slide / 2.0 - viewCenter;
        if (intersection > 0.0) {
            info.parallax = halfView > 0.0 ? std::clamp(distance / halfView, -1.0, 1.0) : 0.0;

            if (distance > 0.0) {
                info.rightVisibility    = info.visibilityPercent;
                info.parallaxVisibility = 1.0 - info.rightVisibility;
            } else {
                info.rightVisibility = 1.0;
            }

            if (distance < 0.0) {
                info.leftVisibility     = info.visibilityPercent;
                info.parallaxVisibility = -(1.0 - info.leftVisibility);
            } else {
                info.leftVisibility = 1.0;
            }

            if (info.visibilityPercent >= 1.0) {
                info.leftVisibility     = 1.0;
                info.rightVisibility    = 1.0;
                info.parallaxVisibility = 0.0;
            }
        } else if (distance > 0.0) {
            info.parallaxVisibility = 1.0;
        } else if (distance < 0.0) {
            info.parallaxVisibility = -1.0;
        }
        result.push_back(info);
    }
    return result;
}

} // namespace ST::Coords
