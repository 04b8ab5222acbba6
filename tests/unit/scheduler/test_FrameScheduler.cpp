#include <slidetrack/events/Events.hpp>
#include <slidetrack/scheduler/FrameScheduler.hpp>
#include <slidetrack/track/TrackMath.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ST;
using namespace std::chrono_literals;

namespace {

struct ProbeLog {
    std::vector<std::string> calls;
    std::vector<double>      offsets;
    bool                     throwOnRender = false;
};

class ProbeEffect final : public RenderEffect {
public:
    explicit ProbeEffect(std::shared_ptr<ProbeLog> log)
        : log_(std::move(log)) {}

    [[nodiscard]] auto name() const -> std::string_view override { return "probe"; }
    auto render(Frame const& frame, Coords::FrameHelpers const&) -> void override {
        log_->calls.emplace_back("render");
        log_->offsets.push_back(frame.animation.offset);
        if (log_->throwOnRender) {
            throw std::runtime_error("probe failed");
        }
    }

private:
    std::shared_ptr<ProbeLog> log_;
};

struct SchedulerFixture {
    std::shared_ptr<ProbeLog> log = std::make_shared<ProbeLog>();
    EffectRegistry            registry;
    std::shared_ptr<EventBus> bus = std::make_shared<EventBus>();
    ReactiveStore             store{bus};
    ManualClock               clock;
    ManualFrameHost           host;
    std::unique_ptr<EffectManager>    effects;
    std::unique_ptr<TrackCoordinator> track;
    std::unique_ptr<FrameScheduler>   scheduler;
    double                            now = 0.0;

    SchedulerFixture() {
        registry.add("probe", [log = log] { return std::make_unique<ProbeEffect>(log); });
        store.setOptions(OptionsPatch{.effect = "probe"});
        effects   = std::make_unique<EffectManager>(store, bus, registry);
        track     = std::make_unique<TrackCoordinator>(store, bus);
        scheduler = std::make_unique<FrameScheduler>(store, *track, *effects, bus, host, clock);

        auto widths = Track::computeWidths(Track::LayoutMetrics{.viewport = 800.0, .gap = 20.0}, 4, 1);
        store.setWidths(widths);
        std::vector<SlideDescriptor> slides;
        for (int i = 0; i < 4; ++i) {
            slides.push_back(SlideDescriptor{.logicalIndex = i, .renderIndex = i, .trackPosition = i * widths.slideAndGap});
        }
        store.setSlides(std::move(slides));
        store.setState(RuntimeStatePatch{.pageCount = 4, .slideCount = 4});

        // Writes above happened before the scheduler subscribed.
        scheduler->requestFrame();
        runUntilIdle();
    }

    auto frame() -> std::size_t {
        now += 16.6;
        clock.advance(16600us);
        return host.runFrame(now);
    }

    auto runUntilIdle(int maxFrames = 2000) -> int {
        int frames = 0;
        while (host.pendingCount() > 0 && frames < maxFrames) {
            frame();
            ++frames;
        }
        return frames;
    }
};

} // namespace

TEST_SUITE("scheduler.frame") {

TEST_CASE("Store changes coalesce into one frame") {
    SchedulerFixture f;
    CHECK_FALSE(f.store.isDirty());
    auto const requests = f.host.requestCount();

    f.store.setState(RuntimeStatePatch{.selectedIndex = 1});
    f.store.setState(RuntimeStatePatch{.selectedIndex = 2});
    f.store.setAnimation(AnimationPatch{.progress = 1.0});
    CHECK(f.host.pendingCount() == 1);
    CHECK(f.host.requestCount() == requests + 1);
    CHECK(f.scheduler->state() == SchedulerState::Scheduled);

    auto const rendered = f.scheduler->framesRendered();
    CHECK(f.frame() == 1);
    CHECK(f.scheduler->framesRendered() == rendered + 1);
    CHECK_FALSE(f.store.isDirty());
    CHECK(f.scheduler->state() == SchedulerState::Idle);
    CHECK(f.host.pendingCount() == 0);
}

TEST_CASE("Cancel drops the pending frame") {
    SchedulerFixture f;
    f.scheduler->requestFrame();
    CHECK(f.scheduler->state() == SchedulerState::Scheduled);
    f.scheduler->cancel();
    CHECK(f.scheduler->state() == SchedulerState::Idle);
    CHECK(f.host.pendingCount() == 0);
    f.scheduler->cancel();
    f.scheduler->requestFrame();
    CHECK(f.host.pendingCount() == 1);
}

TEST_CASE("Pass order") {
    SchedulerFixture f;
    f.log->calls.clear();

    f.bus->on<Events::FrameBeforeRender>([&](Events::FrameBeforeRender const&) { f.log->calls.emplace_back("before"); });
    f.bus->on<Events::FrameAfterRender>([&](Events::FrameAfterRender const&) { f.log->calls.emplace_back("after"); });
    f.bus->on<Events::StoreClean>([&](Events::StoreClean const&) { f.log->calls.emplace_back("clean"); });
    f.scheduler->setVisibilityPass([&](Frame const& frame, std::vector<Coords::SlideVisibility> const& visibility) {
        f.log->calls.emplace_back("visibility");
        CHECK(visibility.size() == frame.slides.size());
    });

    f.store.setState(RuntimeStatePatch{.selectedIndex = 1});
    f.frame();
    CHECK(f.log->calls == std::vector<std::string>{"before", "render", "visibility", "after", "clean"});
    CHECK(f.scheduler->lastVisibility().size() == 4);
    CHECK(f.scheduler->lastVisibility()[0].isFullyVisible);
}

TEST_CASE("Requests during a pass are absorbed") {
    SchedulerFixture f;

    SchedulerState during = SchedulerState::Idle;
    f.bus->on<Events::FrameBeforeRender>([&](Events::FrameBeforeRender const&) {
        during = f.scheduler->state();
        f.scheduler->requestFrame();
        f.store.setState(RuntimeStatePatch{.selectedIndex = 3});
    });
    f.store.setState(RuntimeStatePatch{.selectedIndex = 1});
    f.frame();
    CHECK(during == SchedulerState::Rendering);
    CHECK(f.host.pendingCount() == 0);
    CHECK_FALSE(f.store.isDirty());
    CHECK(f.store.getState().selectedIndex == 3);
}

TEST_CASE("A running animation keeps frames coming until it settles") {
    SchedulerFixture f;
    std::vector<double> finished;
    f.bus->on<Events::MotionFinished>([&](Events::MotionFinished const& e) { finished.push_back(e.finalPosition); });

    f.bus->emit(Events::AnimationRequested{.index = 2});
    auto const frames = f.runUntilIdle();
    CHECK(frames > 2);
    CHECK(frames < 2000);
    CHECK(finished == std::vector<double>{-1640.0});
    CHECK(f.log->offsets.back() == -1640.0);
    CHECK_FALSE(f.store.getAnimation().isRunning);
    CHECK(f.scheduler->state() == SchedulerState::Idle);
}

TEST_CASE("Frames are frozen copies ordered by render index") {
    SchedulerFixture f;
    std::vector<int> order;
    f.scheduler->setVisibilityPass([&](Frame const& frame, std::vector<Coords::SlideVisibility> const&) {
        order.clear();
        for (auto const& slide : frame.slides) {
            order.push_back(slide.logicalIndex);
        }
    });
    f.store.setOptions(OptionsPatch{.loop = true});
    f.frame();
    // Slide 3 wraps in front of slide 0 at the start of the ring.
    CHECK(order == std::vector<int>{3, 0, 1, 2});
}

TEST_CASE("Debounced work runs on a later frame") {
    SchedulerFixture f;
    int runs = 0;

    f.scheduler->debounce("layout", 40ms, [&] { ++runs; });
    f.scheduler->debounce("layout", 40ms, [&] { runs += 10; });
    CHECK(f.scheduler->hasArmedTimers());
    CHECK(f.host.pendingCount() == 1);

    f.frame();
    CHECK(runs == 0);
    CHECK(f.host.pendingCount() == 1);

    f.runUntilIdle(10);
    CHECK(runs == 10);
    CHECK_FALSE(f.scheduler->hasArmedTimers());
    CHECK(f.host.pendingCount() == 0);
}

TEST_CASE("Timers can be cancelled by name") {
    SchedulerFixture f;
    int runs = 0;
    f.scheduler->debounce("resize", 4ms, [&] { ++runs; });
    CHECK(f.scheduler->cancelTimer("resize"));
    CHECK_FALSE(f.scheduler->cancelTimer("resize"));
    CHECK_FALSE(f.scheduler->cancelTimer("unknown"));
    f.runUntilIdle();
    CHECK(runs == 0);
}

TEST_CASE("A failing effect propagates and the scheduler recovers") {
    SchedulerFixture f;
    f.log->throwOnRender = true;
    f.store.setState(RuntimeStatePatch{.selectedIndex = 1});
    CHECK_THROWS_AS(f.frame(), std::runtime_error);
    CHECK(f.scheduler->state() == SchedulerState::Idle);

    f.log->throwOnRender = false;
    f.scheduler->requestFrame();
    CHECK(f.frame() == 1);
}

TEST_CASE("Switching effects requests a frame") {
    SchedulerFixture f;
    f.registry.add("carousel", [log = f.log] { return std::make_unique<ProbeEffect>(log); });
    f.store.setOptions(OptionsPatch{.effect = "carousel"});
    CHECK(f.effects->currentName() == "carousel");
    CHECK(f.host.pendingCount() == 1);
}

} // TEST_SUITE
