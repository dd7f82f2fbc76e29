#include "device_probe.hpp"
#include "error_manager.hpp"

#include <cstring>
#include <sys/ioctl.h>
#include <linux/input.h>

namespace Evdev {

void IoctlProbe::eventBits(int fd, const std::string& path, BitSet& out) const {
    if (::ioctl(fd, EVIOCGBIT(0, out.size()), out.data()) < 0) {
        throwOsError("ERR_EVDEV_IOCTL", "[Evdev] EVIOCGBIT(0) failed on " + path);
    }
}

void IoctlProbe::keyBits(int fd, const std::string& path, BitSet& out) const {
    if (::ioctl(fd, EVIOCGBIT(EV_KEY, out.size()), out.data()) < 0) {
        throwOsError("ERR_EVDEV_IOCTL", "[Evdev] EVIOCGBIT(EV_KEY) failed on " + path);
    }
}

std::optional<std::string> IoctlProbe::deviceName(int fd) const {
    char buf[128];
    std::memset(buf, 0, sizeof(buf));
    if (::ioctl(fd, EVIOCGNAME(sizeof(buf)), buf) < 0) {
        return std::nullopt;
    }
    // Unterminated name -> treat as undecodable
    if (std::memchr(buf, '\0', sizeof(buf)) == nullptr) {
        return std::nullopt;
    }
    return std::string(buf);
}

} // namespace Evdev
