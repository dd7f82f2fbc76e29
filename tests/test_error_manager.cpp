#include <gtest/gtest.h>

#include <cerrno>
#include <cstring>

#include "bootstrap_config.hpp"
#include "error_manager.hpp"

using nlohmann::json;

class ErrorManagerTest : public ::testing::Test {
protected:
    void SetUp() override { ErrorManager::setCatalog(bootstrap_config::defaultErrors()); }
    void TearDown() override { ErrorManager::setCatalog(json::object()); }
};

TEST_F(ErrorManagerTest, ReportReturnsUserMessage) {
    OikosError error("ERR_EVDEV_NO_DEVICES", "[Evdev] No input devices found matching /dev/input/event*");
    EXPECT_EQ(ErrorManager::report(error), "[Input] No input devices found.");
}

TEST_F(ErrorManagerTest, UnknownCodeFallsBack) {
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_NOPE"), "[Error] Unknown error code: ERR_NOPE");
    EXPECT_EQ(ErrorManager::getDebugMessage("ERR_NOPE"), "[Debug] No debug message for code: ERR_NOPE");
}

TEST_F(ErrorManagerTest, AcceptsWrappedCatalog) {
    ErrorManager::setCatalog({ { "errors", { { "ERR_X", { { "user", "x user" }, { "debug", "x debug" } } } } } });
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_X"), "x user");
    EXPECT_EQ(ErrorManager::getDebugMessage("ERR_X"), "x debug");
}

TEST(OikosError, CarriesCodeDetailAndErrno) {
    OikosError error("ERR_RTC_OPEN", "[RTC] Failed to open /dev/rtc0", ENOENT);
    EXPECT_EQ(error.code(), "ERR_RTC_OPEN");
    EXPECT_STREQ(error.what(), "[RTC] Failed to open /dev/rtc0");
    EXPECT_EQ(error.osError(), ENOENT);
}

TEST(OikosError, OsErrorAppendsReason) {
    try {
        throwOsError("ERR_SUSPEND_WRITE", "[Power] Failed to open /sys/power/state", EACCES);
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_SUSPEND_WRITE");
        EXPECT_EQ(e.osError(), EACCES);
        EXPECT_EQ(std::string(e.what()),
                  std::string("[Power] Failed to open /sys/power/state: ") + std::strerror(EACCES));
    }
}
