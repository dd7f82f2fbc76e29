#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool mergeDefaults(nlohmann::json& cfg,
                          const nlohmann::json& defs,
                          const std::string& prefix = "",
                          int* patchedCount = nullptr) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal,
                              prefix.empty() ? key : prefix + "." + key,
                              patchedCount))
                patched = true;
        } else if (cfg[key].type() != defVal.type() &&
                   !(cfg[key].is_number() && defVal.is_number())) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

static void saveConfig(const fs::path& path, const nlohmann::json& config) {
    std::ofstream out(path);
    if (!out) {
        LOG_WARN("Config", "Could not write " + path.string());
        return;
    }
    out << config.dump(2) << "\n";
}

static Timing::Duration durationAt(const nlohmann::json& section, const char* key) {
    return Timing::parseDuration(section.at(key).get<std::string>());
}

// ----------------- defaults -----------------
namespace bootstrap_config {

nlohmann::json defaultConfig() {
    return {
        {"sleep", {
            {"interval", ""},
            {"suspend", false},
            {"suspend_grace_period", "3s"},
            {"wakeup_rtc", "/dev/rtc0"},
            {"power_state", "/sys/power/state"}
        }},
        {"exit_on_keypress", {
            {"keys", nlohmann::json::array()},
            {"devices", "/dev/input/event*"}
        }},
        {"wait_for_network", {
            {"host", ""},
            {"timeout", "30s"}
        }},
        {"refresh_command", ""},
        {"log", {
            {"file", "oikos.log"},
            {"debug", false}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_OS", {
            {"user", "[System] Operating system error."},
            {"debug", "A system call failed in the scheduler core."}
        }},
        {"ERR_EVDEV_OPEN", {
            {"user", "[Input] Cannot open input device."},
            {"debug", "open() of an input device path matched by the device pattern failed."}
        }},
        {"ERR_EVDEV_IOCTL", {
            {"user", "[Input] Cannot query input device capabilities."},
            {"debug", "EVIOCGBIT ioctl failed."}
        }},
        {"ERR_EVDEV_READ", {
            {"user", "[Input] Failed to fetch key press event."},
            {"debug", "read() on an input device failed."}
        }},
        {"ERR_EVDEV_SHORT_READ", {
            {"user", "[Input] Failed to fetch key press event."},
            {"debug", "read() returned less than one input_event record."}
        }},
        {"ERR_EVDEV_PATTERN", {
            {"user", "[Input] Invalid input device path pattern."},
            {"debug", "glob() could not expand exit_on_keypress.devices."}
        }},
        {"ERR_EVDEV_NO_DEVICES", {
            {"user", "[Input] No input devices found."},
            {"debug", "No device matched the pattern and reported one of the exit keys."}
        }},
        {"ERR_TIMER_SETUP", {
            {"user", "[Timer] Failed to set up timer."},
            {"debug", "Arming the interval or grace timer failed."}
        }},
        {"ERR_TIMER_WAIT", {
            {"user", "[Timer] Failed to wait for timer."},
            {"debug", "Reading the timerfd expiration count failed."}
        }},
        {"ERR_RTC_OPEN", {
            {"user", "[RTC] Failed to open RTC device."},
            {"debug", "open() of sleep.wakeup_rtc failed."}
        }},
        {"ERR_RTC_SYSFS", {
            {"user", "[RTC] Failed to access sysfs."},
            {"debug", "device/power/wakeup of the RTC could not be read."}
        }},
        {"ERR_RTC_WAKEUP_UNSUPPORTED", {
            {"user", "[RTC] RTC device does not support wakeup alarms."},
            {"debug", "device/power/wakeup is not \"enabled\"."}
        }},
        {"ERR_RTC_NO_LOCAL_TZ", {
            {"user", "[RTC] RTC uses local timezone, but no local timezone was found."},
            {"debug", "/etc/adjtime says LOCAL; TZ unset and /etc/localtime missing."}
        }},
        {"ERR_RTC_INVALID_TIME", {
            {"user", "[RTC] Unable to convert RTC time."},
            {"debug", "RTC fields are out of range or do not exist in the clock's timezone."}
        }},
        {"ERR_RTC_TIME_RANGE", {
            {"user", "[RTC] Timestamp conversion error."},
            {"debug", "Alarm time is outside the representable range."}
        }},
        {"ERR_RTC_IOCTL", {
            {"user", "[RTC] Clock error."},
            {"debug", "RTC_RD_TIME / RTC_WKALM_RD / RTC_WKALM_SET failed."}
        }},
        {"ERR_RTC_READ", {
            {"user", "[RTC] Failed to wait for RTC alarm."},
            {"debug", "Reading the RTC interrupt status failed."}
        }},
        {"ERR_SUSPEND_WRITE", {
            {"user", "[Power] Failed to suspend via /sys/power/state."},
            {"debug", "Writing \"mem\" to the power-state file failed."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Invalid configuration."},
            {"debug", "oikos_config.json holds a value that cannot be used."}
        }},
        {"ERR_NETWORK_TIMEOUT", {
            {"user", "[Network] Timed out waiting for network."},
            {"debug", "wait_for_network.host was not reachable within the timeout."}
        }},
        {"ERR_REFRESH_FAILED", {
            {"user", "[Refresh] Refresh command failed."},
            {"debug", "refresh_command exited with a non-zero status."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        saveConfig(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, "", &patchedCount)) {
            saveConfig(path, outConfig);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config", name + " invalid (" + e.what() + ") -> reset to defaults");
        LOG_PHASE(name + " load", false);

        outConfig = defaults;
        saveConfig(path, outConfig);
        return false;
    }
}

// ----------------- typed options -----------------
Options parseOptions(const nlohmann::json& config) {
    Options options;

    try {
        const auto& log = config.at("log");
        options.logFile = log.at("file").get<std::string>();
        options.debugLogging = log.at("debug").get<bool>();
        options.refreshCommand = config.at("refresh_command").get<std::string>();

        const auto& net = config.at("wait_for_network");
        std::string host = net.at("host").get<std::string>();
        if (!host.empty()) {
            NetworkOptions network;
            network.host = host;
            network.timeout = durationAt(net, "timeout");
            options.waitForNetwork = network;
        }

        const auto& sleep = config.at("sleep");
        std::string interval = sleep.at("interval").get<std::string>();
        if (interval.empty()) {
            return options;
        }

        SleepOptions s;
        s.interval = Timing::parseDuration(interval);
        s.suspend = sleep.at("suspend").get<bool>();
        s.suspendGrace = durationAt(sleep, "suspend_grace_period");
        s.wakeupRtc = sleep.at("wakeup_rtc").get<std::string>();
        s.powerState = sleep.at("power_state").get<std::string>();

        if (s.interval <= Timing::Duration::zero()) {
            throw OikosError("ERR_CONFIG_INVALID", "[Config] sleep.interval must be positive");
        }
        if (s.suspend && s.interval < kMinSuspendInterval) {
            throw OikosError("ERR_CONFIG_INVALID",
                             "[Config] Suspend to RAM requires a sleep.interval of at least 30 seconds, got " +
                             Timing::formatDuration(s.interval));
        }

        const auto& exitKeys = config.at("exit_on_keypress");
        const auto& keyNames = exitKeys.at("keys");
        if (!keyNames.empty()) {
            ExitOnKeypress e;
            for (const auto& keyName : keyNames) {
                std::string text = keyName.is_number_integer()
                    ? std::to_string(keyName.get<long long>())
                    : keyName.get<std::string>();
                auto key = Evdev::KeyCode::parse(text);
                if (!key) {
                    throw OikosError("ERR_CONFIG_INVALID",
                                     "[Config] Unknown key code name or invalid numeric code: " + text);
                }
                e.keys.push_back(*key);
            }
            e.devices = exitKeys.at("devices").get<std::string>();
            s.exitOnKeypress = e;
        }

        options.sleep = s;
    } catch (const nlohmann::json::exception& e) {
        throw OikosError("ERR_CONFIG_INVALID", std::string("[Config] ") + e.what());
    }

    return options;
}

} // namespace bootstrap_config
