#pragma once
#include <optional>
#include <string>
#include <variant>

#include "duration.hpp"
#include "monotonic_timer.hpp"
#include "rtc_clock.hpp"

namespace Timing {

class Alarm;

// ------------------------------------------------------------
// Timer: one of two wakeup backends, chosen once at construction
// ------------------------------------------------------------
// - monotonic():     repeating CLOCK_MONOTONIC timerfd
// - realtimeAlarm(): RTC one-shot wake alarm, survives suspend-to-RAM
//
// Not reentrant: arming replaces whatever the previous Alarm programmed.
class Timer {
public:
    static Timer monotonic();

    // Kernels before 3.11 have no CLOCK_BOOTTIME_ALARM timerfd, so
    // suspend-capable wakeups program the RTC directly.
    static Timer realtimeAlarm(const std::string& rtcPath);

    explicit Timer(MonotonicTimer timer) : impl_(std::move(timer)) {}
    explicit Timer(RtcClock clock) : impl_(std::move(clock)) {}

    // Arm for `d` (repeating on the monotonic backend). Throws ERR_TIMER_SETUP.
    Alarm set(Duration d) const;

    // One-shot arm; monotonic backend only. Throws ERR_TIMER_SETUP.
    Alarm setOnce(Duration d) const;

    bool isRtc() const { return std::holds_alternative<RtcClock>(impl_); }

private:
    std::variant<MonotonicTimer, RtcClock> impl_;
};

// ------------------------------------------------------------
// Alarm: scoped handle to the currently armed timer
// ------------------------------------------------------------
// Disarmed when it goes out of scope; a failed disarm is logged, not thrown.
class Alarm {
public:
    ~Alarm();

    Alarm(Alarm&& other) noexcept;
    Alarm(const Alarm&) = delete;
    Alarm& operator=(const Alarm&) = delete;
    Alarm& operator=(Alarm&&) = delete;

    // Block until the next expiry; one logical tick per call.
    void wait() const;

    void unset() const;

    // Descriptor that turns readable when the alarm fires.
    int fd() const;

private:
    friend class Timer;

    using Impl = std::variant<const MonotonicTimer*, RtcAlarm>;
    explicit Alarm(Impl impl) : impl_(std::move(impl)) {}

    std::optional<Impl> impl_;  // empty once moved from
};

} // namespace Timing
