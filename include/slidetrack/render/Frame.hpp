#pragma once
#include <slidetrack/store/StateSlices.hpp>

#include <memory>
#include <vector>

namespace ST {

// Immutable view of the store for one tick. Slides ascend by render index.
struct Frame {
    Options                      options;
    RuntimeState                 state;
    Widths                       widths;
    std::vector<SlideDescriptor> slides;
    AnimationDescriptor          animation;
    TransformPoints              transformPoints;
    double                       time = 0.0;
};

[[nodiscard]] auto freezeFrame(StoreSnapshot snapshot, double time) -> std::shared_ptr<Frame const>;

} // namespace ST
