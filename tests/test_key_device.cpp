#include <gtest/gtest.h>

#include <random>
#include <set>
#include <vector>

#include <linux/input.h>
#include <unistd.h>

#include "error_manager.hpp"
#include "evdev/key_device.hpp"
#include "test_helpers.hpp"

using Evdev::BitSet;
using Evdev::KeyCode;
using Evdev::KeyDevice;
using testing_support::Pipe;
using testing_support::makeKeyDevice;
using testing_support::writeEvent;
using testing_support::writePress;

TEST(KeyDevice, EmptyQueueYieldsNothing) {
    Pipe pipe;
    auto device = makeKeyDevice(pipe, { KeyCode(KEY_HOME) });
    EXPECT_FALSE(device.nextKeyPress().has_value());
}

TEST(KeyDevice, ReturnsFilteredPress) {
    Pipe pipe;
    auto device = makeKeyDevice(pipe, { KeyCode(KEY_HOME) });
    writePress(pipe.writeEnd.get(), KEY_HOME);

    EXPECT_EQ(device.nextKeyPress(), KeyCode(KEY_HOME));
    // The trailing EV_SYN is drained on the next call.
    EXPECT_FALSE(device.nextKeyPress().has_value());
}

TEST(KeyDevice, AutoRepeatCountsAsPress) {
    Pipe pipe;
    auto device = makeKeyDevice(pipe, { KeyCode(KEY_HOME) });
    writeEvent(pipe.writeEnd.get(), EV_KEY, KEY_HOME, 2);
    EXPECT_EQ(device.nextKeyPress(), KeyCode(KEY_HOME));
}

TEST(KeyDevice, IgnoresReleasesAndOtherEventTypes) {
    Pipe pipe;
    auto device = makeKeyDevice(pipe, { KeyCode(KEY_HOME) });
    int fd = pipe.writeEnd.get();
    writeEvent(fd, EV_KEY, KEY_HOME, 0);
    writeEvent(fd, EV_SYN, SYN_REPORT, 0);
    writeEvent(fd, EV_REL, REL_X, 5);
    writeEvent(fd, EV_MSC, KEY_HOME, 1);

    EXPECT_FALSE(device.nextKeyPress().has_value());
}

TEST(KeyDevice, SkipsUnfilteredKeysUntilFilteredOne) {
    Pipe pipe;
    auto device = makeKeyDevice(pipe, { KeyCode(KEY_HOME), KeyCode(KEY_POWER) });
    int fd = pipe.writeEnd.get();
    writePress(fd, KEY_A);
    writePress(fd, KEY_B);
    writePress(fd, KEY_POWER);
    writePress(fd, KEY_HOME);

    EXPECT_EQ(device.nextKeyPress(), KeyCode(KEY_POWER));
    EXPECT_EQ(device.nextKeyPress(), KeyCode(KEY_HOME));
    EXPECT_FALSE(device.nextKeyPress().has_value());
}

TEST(KeyDevice, PartialRecordIsAnError) {
    Pipe pipe;
    auto device = makeKeyDevice(pipe, { KeyCode(KEY_HOME) });
    const char junk[5] = { 1, 2, 3, 4, 5 };
    ASSERT_EQ(::write(pipe.writeEnd.get(), junk, sizeof(junk)), 5);

    try {
        device.nextKeyPress();
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_SHORT_READ");
    }
}

TEST(KeyDevice, CreateRejectsEmptyFilter) {
    Pipe pipe;
    EXPECT_FALSE(KeyDevice::create(std::move(pipe.readEnd), {}).has_value());
}

TEST(KeyDevice, OpenFailureNamesPath) {
    try {
        KeyDevice::open("/nonexistent/input/event42");
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_EVDEV_OPEN");
        EXPECT_NE(std::string(e.what()).find("/nonexistent/input/event42"), std::string::npos);
        EXPECT_EQ(e.osError(), ENOENT);
    }
}

TEST(KeyDevice, NeverReportsKeysOutsideFilter) {
    const std::set<KeyCode> filter = { KeyCode(KEY_HOME), KeyCode(KEY_ESC), KeyCode(KEY_F5) };
    Pipe pipe;
    auto device = makeKeyDevice(pipe, filter);

    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> code(0, 120);
    std::uniform_int_distribution<int> value(0, 2);
    std::uniform_int_distribution<int> type(0, 3);

    int expected = 0;
    for (int i = 0; i < 500; i++) {
        std::uint16_t c = static_cast<std::uint16_t>(code(rng));
        std::int32_t v = value(rng);
        std::uint16_t t = type(rng) == 0 ? EV_REL : EV_KEY;
        writeEvent(pipe.writeEnd.get(), t, c, v);
        if (t == EV_KEY && v != 0 && filter.count(KeyCode(c))) {
            expected++;
        }
    }

    int seen = 0;
    while (auto key = device.nextKeyPress()) {
        EXPECT_EQ(filter.count(*key), 1u) << *key;
        seen++;
    }
    EXPECT_EQ(seen, expected);
}

TEST(SupportedKeys, IsIntersectionOfReportedAndRequested) {
    BitSet bits(KeyCode::COUNT);
    bits.set(KEY_HOME);
    bits.set(KEY_A);
    bits.set(KEY_B);

    auto keys = Evdev::supportedKeys(bits, { KeyCode(KEY_HOME), KeyCode(KEY_POWER), KeyCode(KEY_A) });
    EXPECT_EQ(keys, (std::set<KeyCode>{ KeyCode(KEY_HOME), KeyCode(KEY_A) }));

    EXPECT_TRUE(Evdev::supportedKeys(bits, { KeyCode(KEY_POWER) }).empty());
    EXPECT_TRUE(Evdev::supportedKeys(bits, {}).empty());
}

TEST(SupportedKeys, CodesBeyondBitmaskAreUnsupported) {
    BitSet bits(KeyCode::COUNT);
    auto keys = Evdev::supportedKeys(bits, { KeyCode(60000) });
    EXPECT_TRUE(keys.empty());
}
