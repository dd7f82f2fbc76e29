#include <gtest/gtest.h>

#include <cerrno>
#include <map>
#include <memory>
#include <set>

#include <linux/input.h>
#include <unistd.h>

#include "error_manager.hpp"
#include "evdev/key_device.hpp"
#include "test_helpers.hpp"

using Evdev::BitSet;
using Evdev::KeyCode;
using Evdev::KeyDeviceBuilder;
using testing_support::TempDir;

namespace {

struct FakeDevice {
    bool keyEvents = true;
    std::set<std::uint16_t> keys;
    bool failIoctl = false;
};

// Capabilities by path instead of EVIOCGBIT.
class FakeProbe : public Evdev::DeviceProbe {
public:
    explicit FakeProbe(std::map<std::string, FakeDevice> devices) : devices_(std::move(devices)) {}

    void eventBits(int, const std::string& path, BitSet& out) const override {
        const auto& device = lookup(path);
        if (device.failIoctl) {
            throw OikosError("ERR_EVDEV_IOCTL", "[Evdev] EVIOCGBIT failed for " + path, EIO);
        }
        out.set(EV_SYN);
        if (device.keyEvents) out.set(EV_KEY);
    }

    void keyBits(int, const std::string& path, BitSet& out) const override {
        for (auto code : lookup(path).keys) out.set(code);
    }

    std::optional<std::string> deviceName(int) const override { return std::string("fake"); }

private:
    const FakeDevice& lookup(const std::string& path) const {
        static const FakeDevice none{ false, {}, false };
        auto it = devices_.find(path);
        return it == devices_.end() ? none : it->second;
    }

    std::map<std::string, FakeDevice> devices_;
};

class KeyDeviceBuilderTest : public ::testing::Test {
protected:
    std::string add(const std::string& name, FakeDevice device) {
        std::string path = dir_.file(name).string();
        devices_[path] = std::move(device);
        return path;
    }

    std::vector<Evdev::KeyDevice> find(std::vector<KeyCode> keys) {
        return KeyDeviceBuilder::withKeys(std::move(keys))
            .probe(std::make_unique<FakeProbe>(devices_))
            .find(pattern());
    }

    std::string pattern() const { return (dir_.path() / "event*").string(); }

    TempDir dir_;
    std::map<std::string, FakeDevice> devices_;
};

} // namespace

TEST_F(KeyDeviceBuilderTest, FilterIsIntersectionOfRequestedAndSupported) {
    std::string path = add("event0", { true, { KEY_HOME, KEY_A, KEY_B }, false });

    auto devices = find({ KeyCode(KEY_HOME), KeyCode(KEY_POWER), KeyCode(KEY_A) });
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].path(), path);
    EXPECT_EQ(devices[0].filter(), (std::set<KeyCode>{ KeyCode(KEY_HOME), KeyCode(KEY_A) }));
}

TEST_F(KeyDeviceBuilderTest, SkipsDevicesWithoutRequestedKeys) {
    add("event0", { true, { KEY_A }, false });
    std::string power = add("event1", { true, { KEY_POWER }, false });
    add("event2", { false, { KEY_POWER }, false });

    auto devices = find({ KeyCode(KEY_POWER) });
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].path(), power);
    EXPECT_EQ(devices[0].filter(), (std::set<KeyCode>{ KeyCode(KEY_POWER) }));
}

TEST_F(KeyDeviceBuilderTest, KeepsPatternOrder) {
    std::string first = add("event0", { true, { KEY_HOME }, false });
    std::string second = add("event1", { true, { KEY_HOME, KEY_ESC }, false });

    auto devices = find({ KeyCode(KEY_HOME), KeyCode(KEY_ESC) });
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].path(), first);
    EXPECT_EQ(devices[1].path(), second);
    for (const auto& device : devices) {
        EXPECT_FALSE(device.filter().empty());
    }
}

TEST_F(KeyDeviceBuilderTest, NoMatchesIsAnError) {
    try {
        find({ KeyCode(KEY_HOME) });
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_NO_DEVICES");
        EXPECT_NE(std::string(e.what()).find(pattern()), std::string::npos);
    }
}

TEST_F(KeyDeviceBuilderTest, AllFiltersEmptyIsAnError) {
    add("event0", { true, { KEY_A }, false });
    add("event1", { false, {}, false });

    try {
        find({ KeyCode(KEY_HOME) });
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_NO_DEVICES");
    }
}

TEST_F(KeyDeviceBuilderTest, UnopenableMatchIsFatal) {
    add("event0", { true, { KEY_HOME }, false });
    std::string dangling = (dir_.path() / "event1").string();
    ASSERT_EQ(::symlink((dir_.path() / "missing").c_str(), dangling.c_str()), 0);

    try {
        find({ KeyCode(KEY_HOME) });
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_OPEN");
        EXPECT_NE(std::string(e.what()).find(dangling), std::string::npos);
    }
}

TEST_F(KeyDeviceBuilderTest, CapabilityQueryFailureIsFatal) {
    add("event0", { true, { KEY_HOME }, true });

    try {
        find({ KeyCode(KEY_HOME) });
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_IOCTL");
    }
}

TEST_F(KeyDeviceBuilderTest, EmptyPatternIsRejected) {
    try {
        KeyDeviceBuilder::withKeys({ KeyCode(KEY_HOME) }).find("");
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_PATTERN");
    }
}

TEST_F(KeyDeviceBuilderTest, MissingDirectoryMatchesNothing) {
    try {
        KeyDeviceBuilder::withKeys({ KeyCode(KEY_HOME) })
            .probe(std::make_unique<FakeProbe>(devices_))
            .find((dir_.path() / "absent" / "event*").string());
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_NO_DEVICES");
    }
}

TEST_F(KeyDeviceBuilderTest, UnreadableDirectoryIsPatternError) {
    // A self-referencing symlink fails opendir() with ELOOP, even for root.
    auto loop = dir_.path() / "loop";
    ASSERT_EQ(::symlink(loop.c_str(), loop.c_str()), 0);

    try {
        KeyDeviceBuilder::withKeys({ KeyCode(KEY_HOME) })
            .probe(std::make_unique<FakeProbe>(devices_))
            .find((loop / "event*").string());
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_PATTERN");
        EXPECT_EQ(e.osError(), ELOOP);
        EXPECT_NE(std::string(e.what()).find(loop.string()), std::string::npos);
    }
}
