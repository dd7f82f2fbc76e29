#include "key_device.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cerrno>
#include <fcntl.h>
#include <glob.h>
#include <unistd.h>
#include <linux/input.h>

namespace Evdev {

// ------------------------------------------------------------
// Capability filter
// ------------------------------------------------------------
std::set<KeyCode> supportedKeys(const BitSet& keyBits, const std::vector<KeyCode>& requested) {
    std::set<KeyCode> filter;
    for (KeyCode key : requested) {
        if (key.code() < KeyCode::COUNT && keyBits.isSet(key.code())) {
            filter.insert(key);
        }
    }
    return filter;
}

// ------------------------------------------------------------
// KeyDevice
// ------------------------------------------------------------
KeyDevice::KeyDevice(FileDescriptor fd, std::set<KeyCode> filter, std::string path)
    : fd_(std::move(fd)), filter_(std::move(filter)), path_(std::move(path)) {}

FileDescriptor KeyDevice::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        throwOsError("ERR_EVDEV_OPEN", "[Evdev] Failed to open input device file " + path);
    }
    return FileDescriptor(fd);
}

std::optional<KeyDevice> KeyDevice::create(FileDescriptor fd,
                                           std::set<KeyCode> filter,
                                           std::string path) {
    if (filter.empty()) {
        return std::nullopt;
    }
    return KeyDevice(std::move(fd), std::move(filter), std::move(path));
}

std::optional<KeyCode> KeyDevice::nextKeyPress() const {
    for (;;) {
        struct input_event event{};
        ssize_t n = ::read(fd_.get(), &event, sizeof(event));
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return std::nullopt; // nothing queued
            }
            if (errno == EINTR) {
                continue;
            }
            throwOsError("ERR_EVDEV_READ", "[Evdev] Failed to read key event from " + path_);
        }
        if (static_cast<size_t>(n) != sizeof(event)) {
            throw OikosError("ERR_EVDEV_SHORT_READ",
                             "[Evdev] Unexpected end of data reading " + path_ + " (" +
                             std::to_string(n) + " of " + std::to_string(sizeof(event)) + " bytes)");
        }

        if (event.type != EV_KEY || event.value == 0) {
            continue; // not a press or repeat
        }

        KeyCode key(event.code);
        if (filter_.count(key)) {
            return key;
        }
    }
}

// ------------------------------------------------------------
// KeyDeviceBuilder
// ------------------------------------------------------------
static thread_local int t_globErrno = 0;
static thread_local std::string t_globErrorPath;

// Missing directories just match nothing; any other read error aborts.
static int onGlobError(const char* path, int err) {
    if (err == ENOENT || err == ENOTDIR) {
        return 0;
    }
    t_globErrno = err;
    t_globErrorPath = path;
    return 1;
}

static std::vector<std::string> expandPattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw OikosError("ERR_EVDEV_PATTERN", "[Evdev] Empty input device path pattern");
    }

    t_globErrno = 0;
    t_globErrorPath.clear();

    glob_t matches{};
    int rc = ::glob(pattern.c_str(), 0, onGlobError, &matches);

    std::vector<std::string> paths;
    if (rc == 0) {
        for (size_t i = 0; i < matches.gl_pathc; i++) {
            paths.emplace_back(matches.gl_pathv[i]);
        }
    }
    ::globfree(&matches);

    if (rc == GLOB_NOMATCH) {
        return {};
    }
    if (rc == GLOB_ABORTED && t_globErrno != 0) {
        throwOsError("ERR_EVDEV_PATTERN",
                     "[Evdev] Failed to expand input device pattern " + pattern +
                     " (reading " + t_globErrorPath + ")", t_globErrno);
    }
    if (rc != 0) {
        throw OikosError("ERR_EVDEV_PATTERN",
                         "[Evdev] Failed to expand input device pattern " + pattern +
                         (rc == GLOB_ABORTED ? " (read error)" : " (out of memory)"));
    }
    return paths;
}

KeyDeviceBuilder::KeyDeviceBuilder(std::vector<KeyCode> keys)
    : keys_(std::move(keys)), probe_(std::make_unique<IoctlProbe>()) {}

KeyDeviceBuilder KeyDeviceBuilder::withKeys(std::vector<KeyCode> keys) {
    return KeyDeviceBuilder(std::move(keys));
}

KeyDeviceBuilder& KeyDeviceBuilder::probe(std::unique_ptr<DeviceProbe> probe) {
    probe_ = std::move(probe);
    return *this;
}

std::optional<KeyDevice> KeyDeviceBuilder::probeDevice(const std::string& path) const {
    FileDescriptor fd = KeyDevice::open(path);

    BitSet events(EV_CNT);
    probe_->eventBits(fd.get(), path, events);
    if (!events.isSet(EV_KEY)) {
        LOG_TRACE("Evdev", "Skipping " + path + ": no key events");
        return std::nullopt;
    }

    BitSet keys(KeyCode::COUNT);
    probe_->keyBits(fd.get(), path, keys);

    // Kernels before 4.4 have no EVIOCSMASK, so filtering stays in userspace.
    auto device = KeyDevice::create(std::move(fd), supportedKeys(keys, keys_), path);
    if (!device) {
        LOG_TRACE("Evdev", "Skipping " + path + ": none of the requested keys supported");
    }
    return device;
}

std::vector<KeyDevice> KeyDeviceBuilder::find(const std::string& pattern) const {
    std::vector<KeyDevice> devices;

    for (const auto& path : expandPattern(pattern)) {
        auto device = probeDevice(path);
        if (!device) {
            continue;
        }

        if (debugLoggingEnabled()) {
            auto name = probe_->deviceName(device->fd());
            LOG_DEBUG("Evdev", "Opened input device " + path + ": " +
                               (name ? "\"" + *name + "\"" : std::string("<unnamed>")));
        }

        devices.push_back(std::move(*device));
    }

    if (devices.empty()) {
        throw OikosError("ERR_EVDEV_NO_DEVICES",
                         "[Evdev] No input devices found matching " + pattern);
    }
    return devices;
}

} // namespace Evdev
