#include "power.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "file_descriptor.hpp"

namespace Power {

void suspendToRam(const std::string& statePath) {
    FileDescriptor state(::open(statePath.c_str(), O_WRONLY | O_CLOEXEC));
    if (!state.valid()) {
        throwOsError("ERR_SUSPEND_WRITE", "[Power] Failed to open " + statePath);
    }

    static const char kMem[] = "mem";
    LOG_DEBUG("Power", "Suspending to RAM via " + statePath);

    // Single attempt; blocks until the kernel resumes
    ssize_t n = ::write(state.get(), kMem, sizeof(kMem) - 1);

    if (n < 0) {
        throwOsError("ERR_SUSPEND_WRITE", "[Power] Failed to suspend via " + statePath);
    }
    if (static_cast<size_t>(n) != sizeof(kMem) - 1) {
        throw OikosError("ERR_SUSPEND_WRITE", "[Power] Short write to " + statePath);
    }

    LOG_DEBUG("Power", "Resumed from suspend");
}

} // namespace Power
