#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <thread>

#include <poll.h>

#include "error_manager.hpp"
#include "timer/duration.hpp"
#include "timer/timer.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;
using Timing::Timer;

namespace {

bool readable(int fd, int timeoutMs) {
    struct pollfd pfd{ fd, POLLIN, 0 };
    return ::poll(&pfd, 1, timeoutMs) == 1 && (pfd.revents & POLLIN);
}

} // namespace

TEST(Timer, AlarmFiresNoEarlierThanDuration) {
    Timer timer = Timer::monotonic();
    EXPECT_FALSE(timer.isRtc());

    auto start = Clock::now();
    auto alarm = timer.set(100ms);
    alarm.wait();
    EXPECT_GE(Clock::now() - start, 100ms);
}

TEST(Timer, IntervalAlarmRepeats) {
    Timer timer = Timer::monotonic();
    auto start = Clock::now();
    auto alarm = timer.set(50ms);
    alarm.wait();
    alarm.wait();
    EXPECT_GE(Clock::now() - start, 100ms);
}

TEST(Timer, OneShotAlarmFiresOnce) {
    Timer timer = Timer::monotonic();
    auto alarm = timer.setOnce(30ms);
    alarm.wait();
    EXPECT_FALSE(readable(alarm.fd(), 150));
}

TEST(Timer, DroppedAlarmIsDisarmed) {
    Timer timer = Timer::monotonic();
    int fd = -1;
    {
        auto alarm = timer.set(50ms);
        fd = alarm.fd();
    }
    EXPECT_FALSE(readable(fd, 150));
}

TEST(Timer, ExpiredButUnreadAlarmIsClearedOnDrop) {
    Timer timer = Timer::monotonic();
    int fd = -1;
    {
        auto alarm = timer.set(20ms);
        fd = alarm.fd();
        std::this_thread::sleep_for(60ms);
        EXPECT_TRUE(readable(fd, 0));
    }
    EXPECT_FALSE(readable(fd, 0));
}

TEST(Timer, RearmAfterDropStartsFresh) {
    Timer timer = Timer::monotonic();
    {
        auto first = timer.set(20ms);
        std::this_thread::sleep_for(60ms);
    }

    auto start = Clock::now();
    auto second = timer.set(200ms);
    second.wait();
    EXPECT_GE(Clock::now() - start, 200ms);
}

TEST(Timer, MovedAlarmKeepsTimerArmed) {
    Timer timer = Timer::monotonic();
    auto start = Clock::now();
    auto alarm = timer.set(50ms);
    Timing::Alarm moved(std::move(alarm));
    moved.wait();
    EXPECT_GE(Clock::now() - start, 50ms);
}

TEST(Timer, NonPositiveDurationIsSetupError) {
    Timer timer = Timer::monotonic();
    try {
        timer.set(0ms);
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_TIMER_SETUP");
    }
}

TEST(Timer, MissingRtcIsOpenError) {
    try {
        Timer::realtimeAlarm("/nonexistent/rtc9");
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_RTC_OPEN");
    }
}

// RtcClock over a regular file: it opens, but every RTC ioctl fails with ENOTTY.
class RtcTimerTest : public ::testing::Test {
protected:
    Timer makeTimer() {
        std::string device = dir_.file("rtc3").string();
        dir_.file("sys/rtc3/device/power/wakeup", "enabled\n");
        std::string adjtime = dir_.file("adjtime", "0.0 0 0.0\n0\nUTC\n").string();
        return Timer(Timing::RtcClock::open(device, (dir_.path() / "sys").string(), adjtime));
    }

    testing_support::TempDir dir_;
};

TEST_F(RtcTimerTest, SubSecondDurationIsRejected) {
    Timer timer = makeTimer();
    EXPECT_TRUE(timer.isRtc());
    try {
        timer.set(500ms);
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_TIMER_SETUP");
        EXPECT_NE(std::string(e.what()).find("500ms"), std::string::npos);
        EXPECT_EQ(e.osError(), 0);
    }
}

TEST_F(RtcTimerTest, IoctlFailureIsWrappedWithDurationAndErrno) {
    Timer timer = makeTimer();
    try {
        timer.set(5s);
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_TIMER_SETUP");
        EXPECT_EQ(e.osError(), ENOTTY);
        std::string what = e.what();
        EXPECT_NE(what.find("5s"), std::string::npos);
        EXPECT_NE(what.find("RTC_RD_TIME"), std::string::npos);
    }
}

TEST_F(RtcTimerTest, OneShotIsRejected) {
    Timer timer = makeTimer();
    try {
        timer.setOnce(1s);
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_TIMER_SETUP");
    }
}

TEST(Duration, ParsesUnits) {
    EXPECT_EQ(Timing::parseDuration("90s"), 90s);
    EXPECT_EQ(Timing::parseDuration("5m"), 5min);
    EXPECT_EQ(Timing::parseDuration("1h30m"), 90min);
    EXPECT_EQ(Timing::parseDuration("250ms"), 250ms);
    EXPECT_EQ(Timing::parseDuration("2d"), 48h);
    EXPECT_EQ(Timing::parseDuration("45"), 45s);
    EXPECT_EQ(Timing::parseDuration("0s"), 0ms);
}

TEST(Duration, RejectsMalformedText) {
    for (const char* text : { "", "abc", "5x", "1.5s", "-3s", "10s5", "s", "99999999999999999999d" }) {
        try {
            Timing::parseDuration(text);
            ADD_FAILURE() << "accepted \"" << text << "\"";
        } catch (const OikosError& e) {
            EXPECT_EQ(e.code(), "ERR_CONFIG_INVALID") << text;
        }
    }
}

TEST(Duration, FormatsCompactly) {
    EXPECT_EQ(Timing::formatDuration(90min), "1h30m");
    EXPECT_EQ(Timing::formatDuration(250ms), "250ms");
    EXPECT_EQ(Timing::formatDuration(0ms), "0s");
    EXPECT_EQ(Timing::formatDuration(61s + 5ms), "1m1s5ms");
}
