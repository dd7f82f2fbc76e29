#include "rtc_clock.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Timing {

// ============================================================
// Clock mode / sysfs helpers
// ============================================================
ClockMode detectClockMode(const std::string& adjtimePath) {
    std::ifstream in(adjtimePath);
    if (!in) {
        LOG_WARN("RTC", "Cannot read " + adjtimePath + ", assuming UTC clock mode");
        return ClockMode::Utc;
    }

    std::string line;
    for (int i = 0; i < 3; i++) {
        if (!std::getline(in, line)) {
            LOG_WARN("RTC", adjtimePath + " has no clock mode line, assuming UTC");
            return ClockMode::Utc;
        }
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line == "UTC") return ClockMode::Utc;
    if (line == "LOCAL") return ClockMode::Local;

    LOG_WARN("RTC", "Unknown clock mode \"" + line + "\" in " + adjtimePath + ", assuming UTC");
    return ClockMode::Utc;
}

bool wakeupSupported(const std::string& rtcPath, const std::string& sysfsRoot) {
    fs::path name = fs::path(rtcPath).filename();
    if (name.empty()) {
        throw OikosError("ERR_RTC_SYSFS", "[RTC] Cannot derive device name from " + rtcPath);
    }

    fs::path wakeup = fs::path(sysfsRoot) / name / "device" / "power" / "wakeup";
    std::ifstream in(wakeup);
    if (!in) {
        throwOsError("ERR_RTC_SYSFS", "[RTC] Failed to read " + wakeup.string());
    }

    std::string value((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    while (!value.empty() && (value.back() == '\n' || value.back() == ' ' || value.back() == '\r')) {
        value.pop_back();
    }
    return value == "enabled";
}

static void resolveLocalTimezone() {
    const char* tz = std::getenv("TZ");
    std::error_code ec;
    if ((tz == nullptr || *tz == '\0') && !fs::exists("/etc/localtime", ec)) {
        throw OikosError("ERR_RTC_NO_LOCAL_TZ",
                         "[RTC] RTC uses local time, but no local timezone is configured");
    }
    ::tzset();
}

// ============================================================
// Conversions
// ============================================================
static bool sameFields(const struct tm& a, const struct rtc_time& b) {
    return a.tm_year == b.tm_year && a.tm_mon == b.tm_mon && a.tm_mday == b.tm_mday &&
           a.tm_hour == b.tm_hour && a.tm_min == b.tm_min && a.tm_sec == b.tm_sec;
}

static std::string describe(const struct rtc_time& t) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                  t.tm_year + 1900, t.tm_mon + 1, t.tm_mday, t.tm_hour, t.tm_min, t.tm_sec);
    return buf;
}

std::time_t rtcTimeToInstant(const struct rtc_time& time, ClockMode mode) {
    if (time.tm_mon < 0 || time.tm_mon > 11 || time.tm_mday < 1 || time.tm_mday > 31 ||
        time.tm_hour < 0 || time.tm_hour > 23 || time.tm_min < 0 || time.tm_min > 59 ||
        time.tm_sec < 0 || time.tm_sec > 59) {
        throw OikosError("ERR_RTC_INVALID_TIME", "[RTC] Invalid RTC time " + describe(time));
    }

    struct tm fields{};
    fields.tm_year = time.tm_year;
    fields.tm_mon  = time.tm_mon;
    fields.tm_mday = time.tm_mday;
    fields.tm_hour = time.tm_hour;
    fields.tm_min  = time.tm_min;
    fields.tm_sec  = time.tm_sec;

    if (mode == ClockMode::Utc) {
        struct tm copy = fields;
        std::time_t instant = ::timegm(&copy);
        struct tm check{};
        if (::gmtime_r(&instant, &check) == nullptr || !sameFields(check, time)) {
            throw OikosError("ERR_RTC_INVALID_TIME", "[RTC] Invalid RTC time " + describe(time));
        }
        return instant;
    }

    // Local: try both DST interpretations, keep the earliest that maps back
    std::vector<std::time_t> candidates;
    for (int isdst : { 0, 1 }) {
        struct tm copy = fields;
        copy.tm_isdst = isdst;
        std::time_t instant = ::mktime(&copy);
        struct tm check{};
        if (::localtime_r(&instant, &check) != nullptr && sameFields(check, time)) {
            candidates.push_back(instant);
        }
    }
    if (candidates.empty()) {
        throw OikosError("ERR_RTC_INVALID_TIME",
                         "[RTC] Unable to convert RTC time " + describe(time) + " to local time");
    }
    return *std::min_element(candidates.begin(), candidates.end());
}

struct rtc_time instantToRtcTime(std::time_t instant, ClockMode mode) {
    struct tm fields{};
    struct tm* ok = (mode == ClockMode::Utc) ? ::gmtime_r(&instant, &fields)
                                             : ::localtime_r(&instant, &fields);
    if (ok == nullptr) {
        throw OikosError("ERR_RTC_TIME_RANGE",
                         "[RTC] Timestamp " + std::to_string(instant) + " out of range");
    }

    struct rtc_time out{};
    out.tm_sec   = fields.tm_sec;
    out.tm_min   = fields.tm_min;
    out.tm_hour  = fields.tm_hour;
    out.tm_mday  = fields.tm_mday;
    out.tm_mon   = fields.tm_mon;
    out.tm_year  = fields.tm_year;
    out.tm_wday  = -1; // unused
    out.tm_yday  = -1; // unused
    out.tm_isdst = -1; // unused
    return out;
}

struct rtc_time rtcTimeAddSeconds(const struct rtc_time& time, std::int64_t seconds, ClockMode mode) {
    std::time_t base = rtcTimeToInstant(time, mode);
    if ((seconds > 0 && base > std::numeric_limits<std::time_t>::max() - seconds) ||
        (seconds < 0 && base < std::numeric_limits<std::time_t>::min() - seconds)) {
        throw OikosError("ERR_RTC_TIME_RANGE",
                         "[RTC] " + describe(time) + " + " + std::to_string(seconds) + "s overflows");
    }
    return instantToRtcTime(base + static_cast<std::time_t>(seconds), mode);
}

// ============================================================
// RtcClock
// ============================================================
RtcClock RtcClock::open(const std::string& path,
                        const std::string& sysfsRoot,
                        const std::string& adjtimePath) {
    int fd = ::open(path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        throwOsError("ERR_RTC_OPEN", "[RTC] Failed to open RTC device " + path);
    }
    FileDescriptor dev(fd);

    if (!wakeupSupported(path, sysfsRoot)) {
        throw OikosError("ERR_RTC_WAKEUP_UNSUPPORTED",
                         "[RTC] " + path + " does not support wakeup alarms");
    }

    ClockMode mode = detectClockMode(adjtimePath);
    if (mode == ClockMode::Local) {
        resolveLocalTimezone();
    }

    LOG_DEBUG("RTC", "Using RTC " + path + " with " +
                     (mode == ClockMode::Utc ? "UTC" : "LOCAL") + " clock mode");
    return RtcClock(std::move(dev), path, mode);
}

struct rtc_time RtcClock::readTime() const {
    struct rtc_time time{};
    if (::ioctl(fd_.get(), RTC_RD_TIME, &time) < 0) {
        throwOsError("ERR_RTC_IOCTL", "[RTC] RTC_RD_TIME failed on " + path_);
    }
    return time;
}

struct rtc_wkalrm RtcClock::readAlarm() const {
    struct rtc_wkalrm alarm{};
    if (::ioctl(fd_.get(), RTC_WKALM_RD, &alarm) < 0) {
        throwOsError("ERR_RTC_IOCTL", "[RTC] RTC_WKALM_RD failed on " + path_);
    }
    return alarm;
}

void RtcClock::writeAlarm(const struct rtc_wkalrm& alarm) const {
    if (::ioctl(fd_.get(), RTC_WKALM_SET, &alarm) < 0) {
        throwOsError("ERR_RTC_IOCTL", "[RTC] RTC_WKALM_SET failed on " + path_);
    }
}

RtcAlarm RtcClock::setAlarm(Duration d) const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(d).count();

    struct rtc_wkalrm alarm{};
    alarm.enabled = 1;
    alarm.pending = 0;
    alarm.time = rtcTimeAddSeconds(readTime(), static_cast<std::int64_t>(seconds), mode_);
    writeAlarm(alarm);

    LOG_DEBUG("RTC", "Wake alarm set for " + describe(alarm.time));
    return RtcAlarm(*this);
}

// ============================================================
// RtcAlarm
// ============================================================
int RtcAlarm::fd() const {
    return clock_->fd();
}

void RtcAlarm::unset() const {
    struct rtc_wkalrm alarm = clock_->readAlarm();
    alarm.enabled = 0;
    clock_->writeAlarm(alarm);
}

void RtcAlarm::wait() const {
    for (;;) {
        unsigned long irqData = 0;
        ssize_t n = ::read(clock_->fd(), &irqData, sizeof(irqData));
        if (n == static_cast<ssize_t>(sizeof(irqData))) {
            if (irqData & RTC_AF) {
                return;
            }
            continue; // update / periodic interrupt
        }
        if (n >= 0) {
            throw OikosError("ERR_RTC_READ",
                             "[RTC] Unexpected end of data reading " + clock_->path());
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throwOsError("ERR_RTC_READ", "[RTC] Failed to read interrupt status from " + clock_->path());
        }

        struct pollfd pfd{ clock_->fd(), POLLIN, 0 };
        if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) {
            throwOsError("ERR_RTC_READ", "[RTC] poll failed on " + clock_->path());
        }
    }
}

} // namespace Timing
