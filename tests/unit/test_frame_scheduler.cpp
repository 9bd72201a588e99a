/**
 * @file test_frame_scheduler.cpp
 * @brief Unit tests for the FrameScheduler state machine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <shaderstack/frame_scheduler.h>

#include "fake_frame_host.h"

#include <memory>
#include <string>
#include <vector>

using namespace shaderstack;
using namespace shaderstack::testing;
using Catch::Matchers::WithinAbs;

TEST_CASE("Scheduler state transitions", "[scheduler]") {
    FakeFrameHost host;
    std::vector<float> times;
    FrameScheduler scheduler(host, [&times](float t) { times.push_back(t); });

    REQUIRE(scheduler.state() == SchedulerState::Idle);
    REQUIRE(host.pending() == 0);

    scheduler.start();
    REQUIRE(scheduler.state() == SchedulerState::Scheduled);
    REQUIRE(scheduler.hasPendingFrame());
    REQUIRE(host.pending() == 1);

    host.tick();
    REQUIRE(times.size() == 1);
    REQUIRE(scheduler.state() == SchedulerState::Scheduled);
    REQUIRE(host.pending() == 1);

    SECTION("start again is a no-op") {
        scheduler.start();
        REQUIRE(host.pending() == 1);
        REQUIRE(host.requests == 2);
    }

    SECTION("stop cancels the pending request") {
        REQUIRE(scheduler.stop());
        REQUIRE(scheduler.state() == SchedulerState::Stopped);
        REQUIRE(host.pending() == 0);
        REQUIRE(host.cancels == 1);

        host.ticks(3);
        REQUIRE(times.size() == 1);
    }

    SECTION("stop twice reports nothing pending the second time") {
        REQUIRE(scheduler.stop());
        REQUIRE_FALSE(scheduler.stop());
        REQUIRE(host.cancels == 1);
    }
}

TEST_CASE("Scheduler state is Running inside the render callback", "[scheduler]") {
    FakeFrameHost host;
    SchedulerState seen = SchedulerState::Idle;
    FrameScheduler* self = nullptr;
    FrameScheduler scheduler(host, [&](float) { seen = self->state(); });
    self = &scheduler;

    scheduler.start();
    host.tick();

    REQUIRE(seen == SchedulerState::Running);
    REQUIRE(std::string(schedulerStateName(seen)) == "Running");
}

TEST_CASE("Time is seconds since start", "[scheduler]") {
    FakeFrameHost host(5000.0);
    std::vector<float> times;
    FrameScheduler scheduler(host, [&times](float t) { times.push_back(t); });

    scheduler.start();
    host.tick(500.0);
    host.tick(250.0);

    REQUIRE(times.size() == 2);
    REQUIRE_THAT(times[0], WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(times[1], WithinAbs(0.75, 1e-6));
    REQUIRE_THAT(scheduler.lastTime(), WithinAbs(0.75, 1e-6));
}

TEST_CASE("Time never goes backwards", "[scheduler]") {
    FakeFrameHost host(1000.0);
    std::vector<float> times;
    FrameScheduler scheduler(host, [&times](float t) { times.push_back(t); });

    scheduler.start();
    host.tick(1000.0);   // t = 1
    host.setNow(1200.0);
    host.tick(0.0);      // clock moved back to t = 0.2
    host.tick(2000.0);   // t = 2.2

    REQUIRE(times.size() == 3);
    REQUIRE(times[1] >= times[0]);
    REQUIRE(times[2] >= times[1]);
    REQUIRE_THAT(times[1], WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(times[2], WithinAbs(2.2, 1e-5));
}

TEST_CASE("elapsedSeconds is never negative", "[scheduler]") {
    FakeFrameHost host(1000.0);
    FrameScheduler scheduler(host, nullptr);
    scheduler.start();

    REQUIRE(scheduler.elapsedSeconds(500.0) == 0.0f);
    REQUIRE_THAT(scheduler.elapsedSeconds(3000.0), WithinAbs(2.0, 1e-6));
}

TEST_CASE("Suppressed frames keep the loop armed", "[scheduler]") {
    FakeFrameHost host;
    int rendered = 0;
    FrameScheduler scheduler(host, [&rendered](float) { ++rendered; });
    scheduler.start();

    SECTION("paused") {
        scheduler.setPaused(true);
        host.ticks(4);

        REQUIRE(rendered == 0);
        REQUIRE(scheduler.framesSkipped() == 4);
        REQUIRE(host.pending() == 1);
        REQUIRE(scheduler.state() == SchedulerState::Scheduled);

        scheduler.setPaused(false);
        host.tick();
        REQUIRE(rendered == 1);
    }

    SECTION("off-screen") {
        scheduler.setVisible(false);
        host.ticks(3);
        REQUIRE(rendered == 0);
        REQUIRE(host.pending() == 1);

        scheduler.setVisible(true);
        host.tick();
        REQUIRE(rendered == 1);
    }

    SECTION("off-screen with animateWhenOffscreen") {
        scheduler.setAnimateWhenOffscreen(true);
        scheduler.setVisible(false);
        host.ticks(3);
        REQUIRE(rendered == 3);
    }

    SECTION("paused wins over animateWhenOffscreen") {
        scheduler.setAnimateWhenOffscreen(true);
        scheduler.setPaused(true);
        host.ticks(3);
        REQUIRE(rendered == 0);
    }
}

TEST_CASE("Time keeps advancing across a pause", "[scheduler]") {
    FakeFrameHost host(0.0);
    std::vector<float> times;
    FrameScheduler scheduler(host, [&times](float t) { times.push_back(t); });
    scheduler.start();

    host.tick(100.0);
    scheduler.setPaused(true);
    host.ticks(5, 100.0);
    scheduler.setPaused(false);
    host.tick(100.0);

    REQUIRE(times.size() == 2);
    REQUIRE_THAT(times[0], WithinAbs(0.1, 1e-6));
    REQUIRE_THAT(times[1], WithinAbs(0.7, 1e-6));
}

TEST_CASE("Stopping from inside render does not re-arm", "[scheduler]") {
    FakeFrameHost host;
    FrameScheduler* self = nullptr;
    int rendered = 0;
    FrameScheduler scheduler(host, [&](float) {
        ++rendered;
        REQUIRE_FALSE(self->stop());  // the firing request is no longer pending
    });
    self = &scheduler;

    scheduler.start();
    host.tick();
    host.ticks(3);

    REQUIRE(rendered == 1);
    REQUIRE(scheduler.state() == SchedulerState::Stopped);
    REQUIRE(host.pending() == 0);
}

TEST_CASE("Stopped schedulers never restart", "[scheduler]") {
    FakeFrameHost host;
    int rendered = 0;
    FrameScheduler scheduler(host, [&rendered](float) { ++rendered; });

    scheduler.stop();
    scheduler.start();
    scheduler.ensureScheduled();
    host.ticks(2);

    REQUIRE(rendered == 0);
    REQUIRE(host.requests == 0);
}

TEST_CASE("ensureScheduled does not double-request", "[scheduler]") {
    FakeFrameHost host;
    FrameScheduler scheduler(host, nullptr);

    scheduler.ensureScheduled();
    REQUIRE(host.requests == 0);  // Idle

    scheduler.start();
    scheduler.ensureScheduled();
    scheduler.ensureScheduled();
    REQUIRE(host.requests == 1);
    REQUIRE(host.pending() == 1);
}

TEST_CASE("Destroying the scheduler cancels its request", "[scheduler]") {
    FakeFrameHost host;
    {
        FrameScheduler scheduler(host, nullptr);
        scheduler.start();
        REQUIRE(host.pending() == 1);
    }
    REQUIRE(host.pending() == 0);
    REQUIRE(host.cancels == 1);
}

TEST_CASE("A scheduler destroyed mid-tick by another never runs", "[scheduler]") {
    FakeFrameHost host;
    int secondFrames = 0;
    std::unique_ptr<FrameScheduler> second;

    FrameScheduler first(host, [&second](float) { second.reset(); });
    second = std::make_unique<FrameScheduler>(host, [&secondFrames](float) { ++secondFrames; });

    first.start();
    second->start();
    REQUIRE(host.pending() == 2);

    host.tick();

    REQUIRE(second == nullptr);
    REQUIRE(secondFrames == 0);
    REQUIRE(host.cancels == 1);
    REQUIRE(host.pending() == 1);  // first re-armed

    host.ticks(3);
    REQUIRE(first.framesRendered() == 4);
}

TEST_CASE("A request cancelled earlier in the same tick is skipped", "[scheduler]") {
    FakeFrameHost host;
    std::vector<std::string> fired;
    FrameRequestId later = 0;

    host.requestFrame([&](double) {
        fired.push_back("first");
        host.cancelFrame(later);
    });
    later = host.requestFrame([&](double) { fired.push_back("later"); });

    host.tick();

    REQUIRE(fired == std::vector<std::string>{"first"});
    REQUIRE(host.pending() == 0);
}

TEST_CASE("Requests made during a tick run on the next one", "[scheduler]") {
    FakeFrameHost host;
    int inner = 0;

    host.requestFrame([&](double) {
        host.requestFrame([&inner](double) { ++inner; });
    });

    host.tick();
    REQUIRE(inner == 0);
    REQUIRE(host.pending() == 1);

    host.tick();
    REQUIRE(inner == 1);
}
