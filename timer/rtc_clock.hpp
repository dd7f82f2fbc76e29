#pragma once
#include <cstdint>
#include <ctime>
#include <string>

#include <linux/rtc.h>

#include "duration.hpp"
#include "file_descriptor.hpp"

namespace Timing {

// ------------------------------------------------------------
// Clock mode of the hardware RTC (third line of /etc/adjtime)
// ------------------------------------------------------------
enum class ClockMode {
    Utc,
    Local
};

inline constexpr const char* kAdjtimePath = "/etc/adjtime";
inline constexpr const char* kRtcSysfsRoot = "/sys/class/rtc";

// Never throws: unreadable or unexpected content falls back to UTC with a warning.
ClockMode detectClockMode(const std::string& adjtimePath = kAdjtimePath);

// true iff <sysfsRoot>/<rtc name>/device/power/wakeup reads "enabled".
// Throws ERR_RTC_SYSFS if the attribute cannot be read.
bool wakeupSupported(const std::string& rtcPath, const std::string& sysfsRoot = kRtcSysfsRoot);

// ------------------------------------------------------------
// Hardware time <-> calendar instant
// ------------------------------------------------------------
// Ambiguous local times resolve to the earliest instant; nonexistent ones
// (DST gaps) and out-of-range fields throw ERR_RTC_INVALID_TIME.
std::time_t rtcTimeToInstant(const struct rtc_time& time, ClockMode mode);

// wday/yday/isdst are set to -1. Throws ERR_RTC_TIME_RANGE.
struct rtc_time instantToRtcTime(std::time_t instant, ClockMode mode);

// time + seconds, converted back to hardware fields.
struct rtc_time rtcTimeAddSeconds(const struct rtc_time& time, std::int64_t seconds, ClockMode mode);

class RtcClock;

// ------------------------------------------------------------
// RtcAlarm: the armed one-shot wake alarm of an RtcClock
// ------------------------------------------------------------
class RtcAlarm {
public:
    // Blocking reads of the interrupt status word until RTC_AF is set.
    void wait() const;

    // Read the alarm back, clear "enabled", write it again.
    void unset() const;

    int fd() const;

private:
    friend class RtcClock;
    explicit RtcAlarm(const RtcClock& clock) : clock_(&clock) {}

    const RtcClock* clock_;
};

// ------------------------------------------------------------
// RtcClock: /dev/rtcN opened read/write, non-blocking
// ------------------------------------------------------------
class RtcClock {
public:
    /// Open the device and resolve its clock mode.
    /// - Throws ERR_RTC_OPEN, ERR_RTC_SYSFS, ERR_RTC_WAKEUP_UNSUPPORTED,
    ///   or ERR_RTC_NO_LOCAL_TZ (LOCAL mode with no timezone configured).
    static RtcClock open(const std::string& path,
                         const std::string& sysfsRoot = kRtcSysfsRoot,
                         const std::string& adjtimePath = kAdjtimePath);

    // Program the wake alarm to fire `d` (whole seconds) from the RTC's now.
    RtcAlarm setAlarm(Duration d) const;

    ClockMode mode() const { return mode_; }
    const std::string& path() const { return path_; }
    int fd() const { return fd_.get(); }

private:
    friend class RtcAlarm;

    RtcClock(FileDescriptor fd, std::string path, ClockMode mode)
        : fd_(std::move(fd)), path_(std::move(path)), mode_(mode) {}

    struct rtc_time readTime() const;
    struct rtc_wkalrm readAlarm() const;
    void writeAlarm(const struct rtc_wkalrm& alarm) const;

    FileDescriptor fd_;
    std::string path_;
    ClockMode mode_;
};

} // namespace Timing
