#include "timer.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

namespace Timing {

// ============================================================
// Timer
// ============================================================
Timer Timer::monotonic() {
    return Timer(MonotonicTimer::create());
}

Timer Timer::realtimeAlarm(const std::string& rtcPath) {
    return Timer(RtcClock::open(rtcPath));
}

Alarm Timer::set(Duration d) const {
    try {
        if (auto* timer = std::get_if<MonotonicTimer>(&impl_)) {
            timer->armInterval(d);
            return Alarm(timer);
        }

        const auto& clock = std::get<RtcClock>(impl_);
        if (d < std::chrono::seconds(1)) {
            throw OikosError("ERR_RTC_TIME_RANGE",
                             "[RTC] Wake alarms need at least one second, got " + formatDuration(d));
        }
        return Alarm(clock.setAlarm(d));
    } catch (const OikosError& e) {
        throw OikosError("ERR_TIMER_SETUP",
                         "[Timer] Failed to set up timer for " + formatDuration(d) + ": " + e.what(),
                         e.osError());
    }
}

Alarm Timer::setOnce(Duration d) const {
    auto* timer = std::get_if<MonotonicTimer>(&impl_);
    if (timer == nullptr) {
        throw OikosError("ERR_TIMER_SETUP",
                         "[Timer] One-shot timers need the monotonic backend (" + formatDuration(d) + ")");
    }

    try {
        timer->armOnce(d);
        return Alarm(timer);
    } catch (const OikosError& e) {
        throw OikosError("ERR_TIMER_SETUP",
                         "[Timer] Failed to set up one-shot timer for " + formatDuration(d) + ": " + e.what(),
                         e.osError());
    }
}

// ============================================================
// Alarm
// ============================================================
Alarm::Alarm(Alarm&& other) noexcept : impl_(std::move(other.impl_)) {
    other.impl_.reset();
}

Alarm::~Alarm() {
    if (!impl_) {
        return;
    }
    try {
        unset();
    } catch (const std::exception& e) {
        LOG_WARN("Timer", std::string("Failed to disable alarm: ") + e.what());
    }
}

void Alarm::unset() const {
    if (!impl_) return;
    if (auto* timer = std::get_if<const MonotonicTimer*>(&*impl_)) {
        (*timer)->disarm();
    } else {
        std::get<RtcAlarm>(*impl_).unset();
    }
}

void Alarm::wait() const {
    if (!impl_) return;
    if (auto* timer = std::get_if<const MonotonicTimer*>(&*impl_)) {
        (*timer)->wait();
    } else {
        std::get<RtcAlarm>(*impl_).wait();
    }
}

int Alarm::fd() const {
    if (!impl_) return -1;
    if (auto* timer = std::get_if<const MonotonicTimer*>(&*impl_)) {
        return (*timer)->fd();
    }
    return std::get<RtcAlarm>(*impl_).fd();
}

} // namespace Timing
