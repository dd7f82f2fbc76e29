#include "monotonic_timer.hpp"
#include "error_manager.hpp"

#include <cerrno>
#include <poll.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace Timing {

static struct timespec toTimespec(Duration d) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
    struct timespec ts{};
    ts.tv_sec = static_cast<time_t>(secs.count());
    ts.tv_nsec = static_cast<long>(std::chrono::duration_cast<std::chrono::nanoseconds>(d - secs).count());
    return ts;
}

MonotonicTimer MonotonicTimer::create() {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        throwOsError("ERR_TIMER_SETUP", "[Timer] timerfd_create(CLOCK_MONOTONIC) failed");
    }
    return MonotonicTimer(FileDescriptor(fd));
}

void MonotonicTimer::arm(Duration initial, Duration interval) const {
    // A zero it_value would disarm instead of firing immediately
    if (initial <= Duration::zero()) {
        throw OikosError("ERR_TIMER_SETUP",
                         "[Timer] Duration must be positive, got " + formatDuration(initial));
    }

    struct itimerspec spec{};
    spec.it_value = toTimespec(initial);
    spec.it_interval = toTimespec(interval);
    if (::timerfd_settime(fd_.get(), 0, &spec, nullptr) < 0) {
        throwOsError("ERR_TIMER_SETUP", "[Timer] timerfd_settime failed for " + formatDuration(initial));
    }
}

void MonotonicTimer::armInterval(Duration d) const {
    arm(d, d);
}

void MonotonicTimer::armOnce(Duration d) const {
    arm(d, Duration::zero());
}

void MonotonicTimer::disarm() const {
    struct itimerspec spec{};
    if (::timerfd_settime(fd_.get(), 0, &spec, nullptr) < 0) {
        throwOsError("ERR_TIMER_SETUP", "[Timer] Failed to disarm timerfd");
    }
}

std::uint64_t MonotonicTimer::wait() const {
    for (;;) {
        std::uint64_t expirations = 0;
        ssize_t n = ::read(fd_.get(), &expirations, sizeof(expirations));
        if (n == static_cast<ssize_t>(sizeof(expirations))) {
            return expirations;
        }
        if (n >= 0) {
            throw OikosError("ERR_TIMER_WAIT", "[Timer] Short read from timerfd");
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throwOsError("ERR_TIMER_WAIT", "[Timer] Failed to read timerfd");
        }

        // Not expired yet: block until it is
        struct pollfd pfd{ fd_.get(), POLLIN, 0 };
        if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) {
            throwOsError("ERR_TIMER_WAIT", "[Timer] poll on timerfd failed");
        }
    }
}

} // namespace Timing
