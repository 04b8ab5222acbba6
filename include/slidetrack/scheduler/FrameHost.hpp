#pragma once
#include <cstdint>
#include <functional>
#include <map>

namespace ST {

using FrameCallback  = std::function<void(double timeMs)>;
using FrameRequestId = std::uint64_t;

// Host tick source, e.g. a display-refresh callback.
class FrameHost {
public:
    virtual ~FrameHost() = default;

    virtual auto requestFrame(FrameCallback callback) -> FrameRequestId = 0;
    virtual auto cancelFrame(FrameRequestId id) -> void                 = 0;
};

// Runs pending callbacks only when the caller advances it.
class ManualFrameHost final : public FrameHost {
public:
    auto requestFrame(FrameCallback callback) -> FrameRequestId override;
    auto cancelFrame(FrameRequestId id) -> void override;

    // Runs the callbacks pending at call time; returns how many ran.
    auto runFrame(double timeMs) -> std::size_t;
    // Runs frames `stepMs` apart until nothing is pending or `maxFrames` ran.
    auto runUntilIdle(double startMs, double stepMs, std::size_t maxFrames) -> std::size_t;

    [[nodiscard]] auto pendingCount() const -> std::size_t { return pending_.size(); }
    [[nodiscard]] auto requestCount() const -> std::uint64_t { return requests_; }

private:
    std::map<FrameRequestId, FrameCallback> pending_;
    FrameRequestId                          nextId_   = 1;
    std::uint64_t                           requests_ = 0;
};

} // namespace ST
