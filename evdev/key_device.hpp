#pragma once
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "bit_set.hpp"
#include "device_probe.hpp"
#include "key_code.hpp"
#include "file_descriptor.hpp"

namespace Evdev {

// Requested keys the device reports as supported (keyBits ∩ requested).
std::set<KeyCode> supportedKeys(const BitSet& keyBits, const std::vector<KeyCode>& requested);

// ------------------------------------------------------------
// KeyDevice: non-blocking input device restricted to a key filter
// ------------------------------------------------------------
class KeyDevice {
public:
    // Open read-only, non-blocking. Throws ERR_EVDEV_OPEN carrying the path.
    static FileDescriptor open(const std::string& path);

    // Empty optional when the filter is empty; a KeyDevice never has one.
    static std::optional<KeyDevice> create(FileDescriptor fd,
                                           std::set<KeyCode> filter,
                                           std::string path = {});

    /// Drain queued events until a press/repeat of a filtered key shows up.
    /// - Returns the key, or an empty optional once the device would block.
    /// - Releases, non-key events and unfiltered keys are discarded.
    /// - Throws ERR_EVDEV_SHORT_READ on a partial record, ERR_EVDEV_READ otherwise.
    std::optional<KeyCode> nextKeyPress() const;

    int fd() const { return fd_.get(); }
    const std::set<KeyCode>& filter() const { return filter_; }
    const std::string& path() const { return path_; }

private:
    KeyDevice(FileDescriptor fd, std::set<KeyCode> filter, std::string path);

    FileDescriptor fd_;
    std::set<KeyCode> filter_;
    std::string path_;
};

// ------------------------------------------------------------
// KeyDeviceBuilder: glob-driven discovery of devices reporting the keys
// ------------------------------------------------------------
class KeyDeviceBuilder {
public:
    static KeyDeviceBuilder withKeys(std::vector<KeyCode> keys);

    // Replace the capability probe (default: IoctlProbe).
    KeyDeviceBuilder& probe(std::unique_ptr<DeviceProbe> probe);

    // Devices in glob order. Throws ERR_EVDEV_NO_DEVICES if none matched.
    std::vector<KeyDevice> find(const std::string& pattern) const;

private:
    explicit KeyDeviceBuilder(std::vector<KeyCode> keys);

    std::optional<KeyDevice> probeDevice(const std::string& path) const;

    std::vector<KeyCode> keys_;
    std::unique_ptr<DeviceProbe> probe_;
};

} // namespace Evdev
