#pragma once
#include <slidetrack/store/StateSlices.hpp>

#include <vector>

namespace ST::Track {

// Off-screen slides a render effect needs on each side of the viewport.
struct LoopBuffer {
    int left  = 0;
    int right = 0;

    auto operator==(LoopBuffer const&) const -> bool = default;
};

inline constexpr int kGuardSteps = 2;

/**
 * Logical positions live for one frame.
 *
 * `positions` is ordered by ascending priority and holds each position once:
 * guard positions, symmetric padding, the effect's loop buffer, and finally
 * the positions whose span intersects the viewport. When two positions map to
 * the same physical slide the later one wins, so visible positions are never
 * displaced by buffers.
 */
struct RenderWindow {
    std::vector<int> positions;
    int              visibleFirst = 0;
    int              visibleLast  = -1;

    [[nodiscard]] auto empty() const -> bool { return positions.empty(); }
    [[nodiscard]] auto hasVisible() const -> bool { return visibleFirst <= visibleLast; }
};

[[nodiscard]] auto physicalIndex(int position, int slideCount) -> int;

[[nodiscard]] auto computeRenderWindow(double offset,
                                       Widths const& widths,
                                       int slideCount,
                                       LoopBuffer const& loopBuffer,
                                       int guardSteps = kGuardSteps) -> RenderWindow;

// Render index per physical slide. Slides the window never reaches keep `fallback`.
[[nodiscard]] auto assignRenderIndices(RenderWindow const& window, int slideCount, std::vector<int> fallback) -> std::vector<int>;

// Full virtualisation pass: identity mapping when looping is impossible.
[[nodiscard]] auto computeSlidePositions(std::vector<SlideDescriptor> const& slides,
                                         Widths const& widths,
                                         Options const& options,
                                         double offset,
                                         LoopBuffer const& loopBuffer) -> std::vector<SlidePosition>;

} // namespace ST::Track
