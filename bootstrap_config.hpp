#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

#include "evdev/key_code.hpp"
#include "timer/duration.hpp"

// ------------------------------------------------------------
// Typed views of oikos_config.json
// ------------------------------------------------------------
struct ExitOnKeypress {
    std::vector<Evdev::KeyCode> keys;
    std::string devices = "/dev/input/event*";
};

struct SleepOptions {
    Timing::Duration interval{0};
    bool suspend = false;
    Timing::Duration suspendGrace = std::chrono::seconds(3);
    std::string wakeupRtc = "/dev/rtc0";
    std::string powerState = "/sys/power/state";
    std::optional<ExitOnKeypress> exitOnKeypress;
};

struct NetworkOptions {
    std::string host;
    Timing::Duration timeout = std::chrono::seconds(30);
};

struct Options {
    std::optional<SleepOptions> sleep;          // empty: run once and exit
    std::optional<NetworkOptions> waitForNetwork;
    std::string refreshCommand;
    std::string logFile = "oikos.log";
    bool debugLogging = false;
};

// Centralized config bootstrap for oikos
namespace bootstrap_config {

    // Shortest interval that may be combined with suspend-to-RAM
    inline constexpr std::chrono::seconds kMinSuspendInterval{30};

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name);

    // Canonical defaults
    nlohmann::json defaultConfig();
    nlohmann::json defaultErrors();

    // Typed options from a (patched) config. Throws OikosError(ERR_CONFIG_INVALID).
    Options parseOptions(const nlohmann::json& config);
}
