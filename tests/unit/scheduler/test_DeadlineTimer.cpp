#include <slidetrack/scheduler/DeadlineTimer.hpp>
#include <slidetrack/scheduler/FrameHost.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace ST;
using namespace std::chrono_literals;

TEST_SUITE("scheduler.timer") {

TEST_CASE("Fires once the deadline passes") {
    ManualClock   clock;
    DeadlineTimer timer{clock};
    int           fired = 0;

    timer.arm(10ms, [&] { ++fired; });
    CHECK(timer.armed());
    CHECK_FALSE(timer.poll());

    clock.advance(9ms);
    CHECK_FALSE(timer.poll());
    clock.advance(1ms);
    CHECK(timer.poll());
    CHECK(fired == 1);
    CHECK_FALSE(timer.armed());
    CHECK_FALSE(timer.poll());
    CHECK(fired == 1);
}

TEST_CASE("Re-arming replaces the pending callback") {
    ManualClock   clock;
    DeadlineTimer timer{clock};
    std::vector<int> fired;

    timer.arm(4ms, [&] { fired.push_back(1); });
    clock.advance(3ms);
    timer.arm(4ms, [&] { fired.push_back(2); });
    clock.advance(3ms);
    CHECK_FALSE(timer.poll());
    clock.advance(1ms);
    CHECK(timer.poll());
    CHECK(fired == std::vector<int>{2});
}

TEST_CASE("Cancel disarms") {
    ManualClock   clock;
    DeadlineTimer timer{clock};
    int           fired = 0;
    CHECK_FALSE(timer.cancel());
    timer.arm(1ms, [&] { ++fired; });
    CHECK(timer.cancel());
    clock.advance(5ms);
    CHECK_FALSE(timer.poll());
    CHECK(fired == 0);
}

TEST_CASE("A callback may re-arm its own timer") {
    ManualClock   clock;
    DeadlineTimer timer{clock};
    int           fired = 0;
    std::function<void()> again = [&] {
        if (++fired < 3) {
            timer.arm(1ms, again);
        }
    };
    timer.arm(1ms, again);
    for (int i = 0; i < 5; ++i) {
        clock.advance(1ms);
        timer.poll();
    }
    CHECK(fired == 3);
    CHECK_FALSE(timer.armed());
}

} // TEST_SUITE

TEST_SUITE("scheduler.host") {

TEST_CASE("Manual host runs what was pending at call time") {
    ManualFrameHost     host;
    std::vector<double> times;
    host.requestFrame([&](double t) {
        times.push_back(t);
        host.requestFrame([&](double t2) { times.push_back(t2); });
    });
    auto cancelled = host.requestFrame([&](double) { times.push_back(-1.0); });
    host.cancelFrame(cancelled);

    CHECK(host.runFrame(16.0) == 1);
    CHECK(times == std::vector<double>{16.0});
    CHECK(host.pendingCount() == 1);
    CHECK(host.runUntilIdle(32.0, 16.0, 10) == 1);
    CHECK(times == std::vector<double>{16.0, 32.0});
    CHECK(host.requestCount() == 3);
}

} // TEST_SUITE
