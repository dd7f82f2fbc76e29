#pragma once
#include <functional>
#include <string>
#include <vector>

#include "wake.hpp"
#include "power.hpp"
#include "evdev/key_device.hpp"
#include "timer/timer.hpp"

namespace Wake {

// ------------------------------------------------------------
// Sleeper: block until the next interval tick or exit key press,
// optionally suspending to RAM in between
// ------------------------------------------------------------
class Sleeper {
public:
    using SuspendAction = std::function<void()>;

    Sleeper(Timing::Duration duration, Timing::Timer timer);

    // Takes ownership; registration order is the tie-break order.
    Sleeper& wakeupKeys(std::vector<Evdev::KeyDevice> devices);

    Sleeper& suspend(bool yes);
    Sleeper& suspendGrace(Timing::Duration period);

    // Where "mem" is written (default /sys/power/state).
    Sleeper& powerState(std::string path);

    // Replaces the power-state write entirely.
    Sleeper& suspendWith(SuspendAction action);

    Timing::Duration duration() const { return duration_; }
    size_t keyDeviceCount() const { return keyDevices_.size(); }

    /// Wait for one wakeup condition.
    /// - Wait set order: interval timer, key devices (registration order), grace timer.
    /// - With several descriptors ready, the first one in that order to yield a
    ///   result wins; a grace expiry only schedules the suspend.
    /// - The interval alarm is disarmed on every exit path.
    WakeupReason wait() const;

private:
    void suspendNow() const;

    Timing::Duration duration_;
    Timing::Timer timer_;
    std::vector<Evdev::KeyDevice> keyDevices_;
    bool suspend_ = false;
    Timing::Duration suspendGrace_{0};
    std::string powerState_ = Power::kPowerStatePath;
    SuspendAction suspendAction_;
};

} // namespace Wake
