#include <slidetrack/track/Virtualization.hpp>

#include <slidetrack/track/TrackMath.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace ST::Track {

namespace {

enum class Priority : int {
    Guard   = 0,
    Padding = 1,
    Buffer  = 2,
    Visible = 3,
};

auto intersecting(double start, double end, double step, double slide, int first, int last) -> std::vector<int> {
    std::vector<int> hits;
    for (int i = first; i <= last; ++i) {
        auto const slideStart = i * step;
        auto const slideEnd   = slideStart + slide;
        if (slideEnd > start && slideStart < end) {
            hits.push_back(i);
        }
    }
    return hits;
}

auto raise(std::map<int, Priority>& window, int position, Priority priority) -> void {
    auto [it, inserted] = window.try_emplace(position, priority);
    if (!inserted && it->second < priority) {
        it->second = priority;
    }
}

} // namespace

auto physicalIndex(int position, int slideCount) -> int {
    return ((position % slideCount) + slideCount) % slideCount;
}

auto computeRenderWindow(double offset, Widths const& widths, int slideCount, LoopBuffer const& loopBuffer, int guardSteps) -> RenderWindow {
    RenderWindow window;
    auto const   step = widths.slideAndGap;
    if (slideCount <= 0 || step <= 0.0 || widths.viewport <= 0.0) {
        return window;
    }

    auto const viewStart  = -offset;
    auto const viewEnd    = viewStart + widths.viewport;
    auto const guardSpan  = guardSteps * step;
    auto const scanFirst  = static_cast<int>(std::floor((viewStart - guardSpan) / step)) - 1;
    auto const scanLast   = static_cast<int>(std::ceil((viewEnd + guardSpan) / step)) + 1;

    std::map<int, Priority> ranked;
    for (int position : intersecting(viewStart - guardSpan, viewEnd + guardSpan, step, widths.slide, scanFirst, scanLast)) {
        raise(ranked, position, Priority::Guard);
    }

    auto const visible = intersecting(viewStart, viewEnd, step, widths.slide, scanFirst, scanLast);
    if (!visible.empty()) {
        window.visibleFirst = visible.front();
        window.visibleLast  = visible.back();
        for (int position : visible) {
            raise(ranked, position, Priority::Visible);
        }
        for (int i = 1; i <= loopBuffer.left; ++i) {
            raise(ranked, window.visibleFirst - i, Priority::Buffer);
        }
        for (int i = 1; i <= loopBuffer.right; ++i) {
            raise(ranked, window.visibleLast + i, Priority::Buffer);
        }
    }
    if (ranked.empty()) {
        return window;
    }

    std::set<int> used;
    for (auto const& [position, priority] : ranked) {
        used.insert(physicalIndex(position, slideCount));
    }
    if (static_cast<int>(used.size()) < slideCount) {
        auto const remaining  = slideCount - static_cast<int>(used.size());
        auto const leftToAdd  = remaining / 2;
        auto const rightToAdd = remaining - leftToAdd;
        auto const lowest     = ranked.begin()->first;
        auto const highest    = ranked.rbegin()->first;
        for (int i = 1; i <= leftToAdd; ++i) {
            raise(ranked, lowest - i, Priority::Padding);
        }
        for (int i = 1; i <= rightToAdd; ++i) {
            raise(ranked, highest + i, Priority::Padding);
        }
    }

    window.positions.reserve(ranked.size());
    for (auto priority : {Priority::Guard, Priority::Padding, Priority::Buffer, Priority::Visible}) {
        for (auto const& [position, rank] : ranked) {
            if (rank == priority) {
                window.positions.push_back(position);
            }
        }
    }
    return window;
}

auto assignRenderIndices(RenderWindow const& window, int slideCount, std::vector<int> fallback) -> std::vector<int> {
    fallback.resize(static_cast<std::size_t>(std::max(slideCount, 0)), 0);
    if (slideCount <= 0) {
        return fallback;
    }
    for (int position : window.positions) {
        fallback[static_cast<std::size_t>(physicalIndex(position, slideCount))] = position;
    }
    return fallback;
}

auto computeSlidePositions(std::vector<SlideDescriptor> const& slides,
                           Widths const& widths,
                           Options const& options,
                           double offset,
                           LoopBuffer const& loopBuffer) -> std::vector<SlidePosition> {
    auto const count = static_cast<int>(slides.size());

    std::vector<int> renderIndices(slides.size());
    if (canLoop(count, options)) {
        std::vector<int> previous;
        previous.reserve(slides.size());
        for (auto const& slide : slides) {
            previous.push_back(slide.renderIndex);
        }
        auto window   = computeRenderWindow(offset, widths, count, loopBuffer);
        renderIndices = window.empty() ? std::move(previous) : assignRenderIndices(window, count, std::move(previous));
    } else {
        for (int i = 0; i < count; ++i) {
            renderIndices[static_cast<std::size_t>(i)] = i;
        }
    }

    std::vector<SlidePosition> positions;
    positions.reserve(slides.size());
    for (int renderIndex : renderIndices) {
        auto const trackPosition = roundToHalf(renderIndex * widths.slideAndGap);
        positions.push_back(SlidePosition{
            .renderIndex   = renderIndex,
            .trackPosition = trackPosition,
            .centerPoint   = roundToHalf(trackPosition + widths.slide / 2.0),
        });
    }
    return positions;
}

} // namespace ST::Track
