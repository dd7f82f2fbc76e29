#include "sleeper.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <optional>
#include <poll.h>

namespace Wake {

Sleeper::Sleeper(Timing::Duration duration, Timing::Timer timer)
    : duration_(duration), timer_(std::move(timer)) {}

Sleeper& Sleeper::wakeupKeys(std::vector<Evdev::KeyDevice> devices) {
    for (auto& device : devices) {
        int fd = device.fd();
        bool known = std::any_of(keyDevices_.begin(), keyDevices_.end(),
                                 [fd](const Evdev::KeyDevice& d) { return d.fd() == fd; });
        if (known) {
            LOG_WARN("Sleeper", "Ignoring duplicate key device fd " + std::to_string(fd));
            continue;
        }
        keyDevices_.push_back(std::move(device));
    }
    return *this;
}

Sleeper& Sleeper::suspend(bool yes) {
    suspend_ = yes;
    return *this;
}

Sleeper& Sleeper::suspendGrace(Timing::Duration period) {
    suspendGrace_ = period;
    return *this;
}

Sleeper& Sleeper::powerState(std::string path) {
    powerState_ = std::move(path);
    return *this;
}

Sleeper& Sleeper::suspendWith(SuspendAction action) {
    suspendAction_ = std::move(action);
    return *this;
}

void Sleeper::suspendNow() const {
    if (suspendAction_) {
        suspendAction_();
    } else {
        Power::suspendToRam(powerState_);
    }
}

WakeupReason Sleeper::wait() const {
    Timing::Alarm alarm = timer_.set(duration_);

    std::vector<struct pollfd> waitSet;
    waitSet.push_back({ alarm.fd(), POLLIN, 0 });
    for (const auto& device : keyDevices_) {
        waitSet.push_back({ device.fd(), POLLIN, 0 });
    }

    bool suspendDue = false;
    std::optional<Timing::Timer> graceTimer;
    std::optional<Timing::Alarm> graceAlarm;
    if (suspend_) {
        if (suspendGrace_ <= Timing::Duration::zero()) {
            suspendDue = true;
        } else {
            LOG_DEBUG("Sleeper", "Waiting " + Timing::formatDuration(suspendGrace_) +
                                 " before suspending to RAM");
            graceTimer.emplace(Timing::Timer::monotonic());
            graceAlarm.emplace(graceTimer->setOnce(suspendGrace_));
            waitSet.push_back({ graceAlarm->fd(), POLLIN, 0 });
        }
    }

    const size_t firstKey = 1;
    const size_t graceIndex = firstKey + keyDevices_.size();

    for (;;) {
        if (suspendDue) {
            suspendDue = false;
            suspendNow();
        }

        if (::poll(waitSet.data(), waitSet.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwOsError("ERR_OS", "[Sleeper] poll failed");
        }

        for (size_t i = 0; i < waitSet.size(); i++) {
            if (waitSet[i].revents == 0) {
                continue;
            }

            if (i == 0) {
                alarm.wait();
                LOG_DEBUG("Sleeper", "Woke up: interval tick");
                return WakeupReason::intervalTick();
            }

            if (i < graceIndex) {
                const auto& device = keyDevices_[i - firstKey];
                if (auto key = device.nextKeyPress()) {
                    LOG_DEBUG("Sleeper", "Woke up: key " + key->name() + " on " + device.path());
                    return WakeupReason::exitKeyPressed(*key);
                }
                continue;
            }

            // Grace period over
            graceAlarm->wait();
            suspendDue = true;
        }
    }
}

} // namespace Wake
