#include <slidetrack/render/CarouselEffect.hpp>

namespace ST {

auto CarouselEffect::render(Frame const& frame, Coords::FrameHelpers const&) -> void {
    ++renderCount_;
    trackWidth_       = frame.widths.track;
    slideWidth_       = frame.widths.slide;
    trackTranslation_ = frame.animation.offset;

    placements_.clear();
    placements_.reserve(frame.slides.size());
    for (auto const& slide : frame.slides) {
        placements_.push_back(SlidePlacement{
            .logicalIndex = slide.logicalIndex,
            .renderIndex  = slide.renderIndex,
            .translateX   = slide.trackPosition,
        });
    }
}

} // namespace ST
