#pragma once
#include <optional>
#include <string>

#include "bit_set.hpp"

namespace Evdev {

// ------------------------------------------------------------
// DeviceProbe: capability queries against an opened input device
// ------------------------------------------------------------
class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    // Supported event types (EV_* bits). Throws OikosError on failure.
    virtual void eventBits(int fd, const std::string& path, BitSet& out) const = 0;

    // Supported EV_KEY codes. Throws OikosError on failure.
    virtual void keyBits(int fd, const std::string& path, BitSet& out) const = 0;

    // Human-readable device name; empty optional if it cannot be read.
    virtual std::optional<std::string> deviceName(int fd) const = 0;
};

// Default probe: EVIOCGBIT / EVIOCGNAME ioctls.
class IoctlProbe : public DeviceProbe {
public:
    void eventBits(int fd, const std::string& path, BitSet& out) const override;
    void keyBits(int fd, const std::string& path, BitSet& out) const override;
    std::optional<std::string> deviceName(int fd) const override;
};

} // namespace Evdev
