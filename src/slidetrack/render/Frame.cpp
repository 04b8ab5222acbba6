#include <slidetrack/render/Frame.hpp>

#include <algorithm>

namespace ST {

auto freezeFrame(StoreSnapshot snapshot, double time) -> std::shared_ptr<Frame const> {
    std::ranges::stable_sort(snapshot.slides, {}, &SlideDescriptor::renderIndex);
    return std::make_shared<Frame>(Frame{
        .options         = std::move(snapshot.options),
        .state           = snapshot.state,
        .widths          = snapshot.widths,
        .slides          = std::move(snapshot.slides),
        .animation       = snapshot.animation,
        .transformPoints = std::move(snapshot.transformPoints),
        .time            = time,
    });
}

} // namespace ST
