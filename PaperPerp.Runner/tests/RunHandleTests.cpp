#include <gtest/gtest.h>
#include <boost/thread.hpp>
#include <chrono>
#include <csignal>
#include "Clock.hpp"
#include "RunHandle.hpp"
#include "SignalTrap.hpp"

using namespace PaperPerp::Runner;

TEST(RunHandleTest, LifecycleFirstFinishWins) {
    RunHandle handle;
    EXPECT_EQ(handle.state(), RunState::Idle);
    handle.begin();
    EXPECT_EQ(handle.state(), RunState::Running);
    EXPECT_THROW(handle.begin(), std::logic_error);

    handle.finish(RunState::StoppedByLossLimit, "floor");
    handle.finish(RunState::StoppedByTimeLimit, "later");
    EXPECT_EQ(handle.state(), RunState::StoppedByLossLimit);
    EXPECT_EQ(handle.stop_reason(), "floor");
    EXPECT_EQ(handle.wait(), RunState::StoppedByLossLimit);
}

TEST(RunHandleTest, FinishNeedsTerminalState) {
    RunHandle handle;
    handle.begin();
    EXPECT_THROW(handle.finish(RunState::Running, "no"), std::invalid_argument);
}

TEST(RunHandleTest, StopRequestWakesWaiter) {
    RunHandle handle;
    EXPECT_FALSE(handle.wait_for(std::chrono::milliseconds(5)));

    boost::thread requester([&handle] {
        boost::this_thread::sleep_for(boost::chrono::milliseconds(20));
        handle.request_stop("operator");
    });
    const auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(handle.wait_for(std::chrono::seconds(30)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    requester.join();

    EXPECT_TRUE(handle.stop_requested());
    EXPECT_EQ(handle.requested_reason(), "operator");
}

TEST(RunHandleTest, StateNames) {
    EXPECT_EQ(to_string(RunState::StoppedBySignal), "STOPPED_BY_SIGNAL");
    EXPECT_EQ(to_string(RunState::StoppedByTimeLimit), "STOPPED_BY_TIME_LIMIT");
    EXPECT_TRUE(is_terminal(RunState::Error));
    EXPECT_FALSE(is_terminal(RunState::Running));
}

TEST(SignalTrapTest, RecordsDeliveredSignal) {
    SignalTrap::reset();
    {
        SignalTrap trap;
        EXPECT_FALSE(SignalTrap::triggered());
        std::raise(SIGTERM);
        EXPECT_TRUE(SignalTrap::triggered());
        EXPECT_EQ(SignalTrap::last_signal(), SIGTERM);
    }
    SignalTrap::reset();
    EXPECT_FALSE(SignalTrap::triggered());
}

TEST(SystemClockTest, WaitEndsEarlyOnTrappedSignal) {
    SignalTrap::reset();
    SignalTrap trap;
    RunHandle handle;
    SystemClock clock;

    boost::thread notifier([] {
        boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
        SignalTrap::notify(SIGINT);
    });
    const auto start = std::chrono::steady_clock::now();
    clock.wait(std::chrono::milliseconds(10000), handle);
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    notifier.join();
    SignalTrap::reset();

    EXPECT_LT(waited.count(), 2000);
    EXPECT_FALSE(handle.stop_requested());
}

TEST(SystemClockTest, WaitRunsFullDelayWithoutStop) {
    SignalTrap::reset();
    RunHandle handle;
    SystemClock clock;

    const auto start = std::chrono::steady_clock::now();
    clock.wait(std::chrono::milliseconds(250), handle);
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    EXPECT_GE(waited.count(), 240);
}
