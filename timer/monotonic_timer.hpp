#pragma once
#include <cstdint>

#include "duration.hpp"
#include "file_descriptor.hpp"

namespace Timing {

// ------------------------------------------------------------
// MonotonicTimer: CLOCK_MONOTONIC timerfd (non-blocking, close-on-exec)
// ------------------------------------------------------------
class MonotonicTimer {
public:
    // Throws ERR_TIMER_SETUP if the timerfd cannot be created.
    static MonotonicTimer create();

    // Initial expiry and repeat period both equal to d.
    void armInterval(Duration d) const;

    // Single expiry after d.
    void armOnce(Duration d) const;

    void disarm() const;

    /// Block until the timer has expired at least once.
    /// - Consumes the whole expiration backlog and returns its size.
    std::uint64_t wait() const;

    int fd() const { return fd_.get(); }

private:
    explicit MonotonicTimer(FileDescriptor fd) : fd_(std::move(fd)) {}

    void arm(Duration initial, Duration interval) const;

    FileDescriptor fd_;
};

} // namespace Timing
