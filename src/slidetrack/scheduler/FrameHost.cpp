#include <slidetrack/scheduler/FrameHost.hpp>

#include <utility>

namespace ST {

auto ManualFrameHost::requestFrame(FrameCallback callback) -> FrameRequestId {
    auto id = nextId_++;
    ++requests_;
    pending_.emplace(id, std::move(callback));
    return id;
}

auto ManualFrameHost::cancelFrame(FrameRequestId id) -> void {
    pending_.erase(id);
}

auto ManualFrameHost::runFrame(double timeMs) -> std::size_t {
    auto due = std::exchange(pending_, {});
    for (auto& [id, callback] : due) {
        callback(timeMs);
    }
    return due.size();
}

auto ManualFrameHost::runUntilIdle(double startMs, double stepMs, std::size_t maxFrames) -> std::size_t {
    std::size_t frames = 0;
    auto        time   = startMs;
    while (!pending_.empty() && frames < maxFrames) {
        this->runFrame(time);
        time += stepMs;
        ++frames;
    }
    return frames;
}

} // namespace ST
