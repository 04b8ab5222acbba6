#pragma once
#include <slidetrack/coords/CoordinateSystem.hpp>
#include <slidetrack/render/Frame.hpp>
#include <slidetrack/track/Virtualization.hpp>

#include <limits>
#include <string_view>

namespace ST {

struct EffectRules {
    double            minSlideWidth    = 1.0;
    double            maxSlideWidth    = std::numeric_limits<double>::infinity();
    int               minSlidesPerView = 1;
    int               maxSlidesPerView = std::numeric_limits<int>::max();
    Track::LoopBuffer loopBuffer;
};

/**
 * Render callback invoked once per frame with the frozen frame and helpers
 * bound to it. Implementations keep whatever presentation state they need;
 * the core never inspects it.
 */
class RenderEffect {
public:
    virtual ~RenderEffect() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
    [[nodiscard]] virtual auto rules() const -> EffectRules { return {}; }
    virtual auto render(Frame const& frame, Coords::FrameHelpers const& helpers) -> void = 0;
};

} // namespace ST
