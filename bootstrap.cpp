#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

Options runBootstrapChecks(int argc, char** argv) {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);

    beginPhaseGroup();
    fs::path resourceDir = getResourcePath();

    fs::path cfgPath = (argc > 1) ? fs::path(argv[1]) : resourceDir / OIKOS_CONFIG_FILE;
    nlohmann::json config;
    bootstrap_config::loadConfig(cfgPath, bootstrap_config::defaultConfig(), config, "oikos config");

    fs::path errPath = resourceDir / OIKOS_ERRORS_FILE;
    nlohmann::json errorsCfg;
    bootstrap_config::loadConfig(errPath, bootstrap_config::defaultErrors(), errorsCfg, "Errors config");
    ErrorManager::setCatalog(errorsCfg);
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    Options options = bootstrap_config::parseOptions(config);
    if (options.debugLogging) {
        setDebugLogging(true);
    }
    LOG_DEBUG("Config", "Loaded " + cfgPath.string());

    // ============================================================
    // Bootstrap complete
    // ============================================================
    LOG_PHASE("Bootstrap complete", true);
    return options;
}

Wake::Sleeper buildSleeper(const SleepOptions& options) {
    Timing::Timer ticker = options.suspend
        ? Timing::Timer::realtimeAlarm(options.wakeupRtc)
        : Timing::Timer::monotonic();
    LOG_PHASE(options.suspend ? "RTC alarm timer ready" : "Monotonic timer ready", true);

    Wake::Sleeper sleeper(options.interval, std::move(ticker));
    sleeper.powerState(options.powerState);
    if (options.suspend) {
        sleeper.suspend(true).suspendGrace(options.suspendGrace);
    }

    if (options.exitOnKeypress) {
        auto devices = Evdev::KeyDeviceBuilder::withKeys(options.exitOnKeypress->keys)
                           .find(options.exitOnKeypress->devices);
        LOG_DEBUG("Evdev", "Watching " + std::to_string(devices.size()) + " input device(s) for exit keys");
        sleeper.wakeupKeys(std::move(devices));
    }

    LOG_PHASE("Sleeper configured", true);
    return sleeper;
}
