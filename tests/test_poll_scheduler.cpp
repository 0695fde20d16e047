/**
 * chiralmon - Poll Scheduler and Timer Scope Tests
 */

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "../src/core/PollScheduler.h"
#include "../src/core/TimerScope.h"
#include "../src/util/Log.h"

using namespace chiral;
using namespace std::chrono_literals;

static int passed = 0;
static int failed = 0;

static void check(bool ok, const std::string& name) {
    if (ok) {
        std::cout << "[PASS] " << name << std::endl;
        passed++;
    } else {
        std::cout << "[FAIL] " << name << std::endl;
        failed++;
    }
}

static void testPeriodicTicks() {
    boost::asio::io_context io;
    PollScheduler poller(io, "ticks");

    int ticks = 0;
    check(poller.start(20ms, [&]() { ticks++; }), "start returns true");
    check(!poller.start(20ms, [&]() { ticks += 100; }), "second start is a no-op");

    io.run_for(130ms);
    check(ticks >= 3 && ticks < 100, "fires repeatedly (" + std::to_string(ticks) + " ticks)");
    check(poller.tickCount() == static_cast<uint64_t>(ticks), "tickCount matches callbacks");
}

static void testBadArguments() {
    boost::asio::io_context io;
    PollScheduler poller(io, "bad");
    check(!poller.start(0ms, []() {}), "zero interval rejected");
    check(!poller.start(10ms, nullptr), "empty callback rejected");
    check(!poller.isRunning(), "not running after rejected start");
}

static void testStopFromCallback() {
    boost::asio::io_context io;
    PollScheduler poller(io, "self-stop");

    int ticks = 0;
    poller.start(10ms, [&]() {
        ticks++;
        poller.stop();
    });

    io.run_for(80ms);
    check(ticks == 1, "stop inside callback prevents further ticks");
    check(!poller.isRunning(), "not running after stop");
}

static void testStopAfterExpiry() {
    boost::asio::io_context io;
    PollScheduler poller(io, "expired");

    int ticks = 0;
    poller.start(5ms, [&]() { ticks++; });

    // Timer expires while the loop is not running; its completion may already be due
    std::this_thread::sleep_for(20ms);
    poller.stop();
    poller.stop();

    io.run_for(40ms);
    check(ticks == 0, "no callback after stop even when the timer had expired");
}

static void testRestart() {
    boost::asio::io_context io;
    PollScheduler poller(io, "restart");

    int first = 0;
    int second = 0;

    // Rapid start/stop/restart before the loop runs
    poller.start(10ms, [&]() { first++; });
    poller.stop();
    poller.start(10ms, [&]() { first++; });
    poller.stop();
    poller.start(10ms, [&]() { second++; });

    io.run_for(55ms);
    check(first == 0, "callbacks of stopped runs never fire");
    check(second >= 2, "only the latest run fires");
}

static void testDestructorStops() {
    boost::asio::io_context io;
    int ticks = 0;
    {
        auto poller = std::make_unique<PollScheduler>(io, "scoped");
        poller->start(5ms, [&]() { ticks++; });
    }
    io.run_for(30ms);
    check(ticks == 0, "destroying a scheduler stops it");
}

static void testTimerScopeReplace() {
    boost::asio::io_context io;
    TimerScope scope(io, "scope");

    int a = 0;
    int b = 0;
    scope.schedule("key", 10ms, [&]() { a++; });
    scope.schedule("key", 20ms, [&]() { b++; });
    check(scope.pendingCount() == 1, "rescheduling a key does not stack timers");

    io.run_for(60ms);
    check(a == 0 && b == 1, "only the replacement fires");
    check(!scope.pending("key"), "key no longer pending after firing");
    check(scope.firedCount() == 1, "fired count");
}

static void testTimerScopeCancel() {
    boost::asio::io_context io;
    TimerScope scope(io, "scope");

    int fired = 0;
    scope.schedule("a", 10ms, [&]() { fired++; });
    check(scope.cancel("a"), "cancel reports pending timer");
    check(!scope.cancel("a"), "second cancel finds nothing");

    io.run_for(40ms);
    check(fired == 0, "cancelled timer never fires");
}

static void testTimerScopeRescheduleFromCallback() {
    boost::asio::io_context io;
    TimerScope scope(io, "scope");

    int fired = 0;
    std::function<void()> again = [&]() {
        fired++;
        if (fired < 3) {
            scope.schedule("loop", 5ms, again);
        }
    };
    scope.schedule("loop", 5ms, again);

    io.run_for(80ms);
    check(fired == 3, "callback can reschedule its own key");
}

static void testTimerScopeClose() {
    boost::asio::io_context io;
    TimerScope scope(io, "scope");

    int oneShot = 0;
    int ticks = 0;
    scope.schedule("x", 10ms, [&]() { oneShot++; });
    scope.schedule("y", 15ms, [&]() { oneShot++; });

    PollScheduler* poller = scope.addPoller("poll");
    check(poller != nullptr, "addPoller creates a poller");
    check(scope.addPoller("poll") == nullptr, "duplicate poller name rejected");
    check(scope.poller("poll") == poller, "poller lookup");
    poller->start(5ms, [&]() { ticks++; });

    scope.close();
    scope.close();

    check(scope.isClosed(), "scope reports closed");
    check(scope.pendingCount() == 0, "close drops every timer");
    check(!scope.schedule("z", 1ms, [&]() { oneShot++; }), "schedule refused after close");
    check(scope.addPoller("late") == nullptr, "addPoller refused after close");

    io.run_for(40ms);
    check(oneShot == 0 && ticks == 0, "nothing fires after close");
}

static void testCallbackExceptionContained() {
    boost::asio::io_context io;
    PollScheduler poller(io, "throws");

    int ticks = 0;
    poller.start(10ms, [&]() {
        ticks++;
        throw std::runtime_error("boom");
    });

    io.run_for(45ms);
    check(ticks >= 2, "exception in callback does not stop the scheduler");
}

int main() {
    Log::setConsole(false);

    std::cout << "=== PollScheduler ===" << std::endl;
    testPeriodicTicks();
    testBadArguments();
    testStopFromCallback();
    testStopAfterExpiry();
    testRestart();
    testDestructorStops();
    testCallbackExceptionContained();

    std::cout << "\n=== TimerScope ===" << std::endl;
    testTimerScopeReplace();
    testTimerScopeCancel();
    testTimerScopeRescheduleFromCallback();
    testTimerScopeClose();

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Passed: " << passed << ", Failed: " << failed << std::endl;

    return failed == 0 ? 0 : 1;
}
