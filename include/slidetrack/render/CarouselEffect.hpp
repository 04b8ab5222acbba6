#pragma once
#include <slidetrack/render/RenderEffect.hpp>

#include <cstdint>
#include <vector>

namespace ST {

struct SlidePlacement {
    int    logicalIndex = 0;
    int    renderIndex  = 0;
    double translateX   = 0.0;
};

// Identity placement: every slide sits at its track position, the track at the offset.
class CarouselEffect final : public RenderEffect {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "carousel"; }
    auto render(Frame const& frame, Coords::FrameHelpers const& helpers) -> void override;

    [[nodiscard]] auto trackTranslation() const -> double { return trackTranslation_; }
    [[nodiscard]] auto trackWidth() const -> double { return trackWidth_; }
    [[nodiscard]] auto slideWidth() const -> double { return slideWidth_; }
    [[nodiscard]] auto placements() const -> std::vector<SlidePlacement> const& { return placements_; }
    [[nodiscard]] auto renderCount() const -> std::uint64_t { return renderCount_; }

private:
    double                      trackTranslation_ = 0.0;
    double                      trackWidth_       = 0.0;
    double                      slideWidth_       = 0.0;
    std::vector<SlidePlacement> placements_;
    std::uint64_t               renderCount_ = 0;
};

} // namespace ST
