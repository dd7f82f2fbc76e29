#include "pch.hpp"
#include "bootstrap.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "network/wait_for_network.hpp"
#include "wake/sleeper.hpp"

#include <sys/wait.h>

// ============================================================
// Refresh: rendering and drawing live in an external command
// ============================================================
static void runRefresh(const std::string& command) {
    LOG_TRACE("Refresh", "Running: " + command);
    int status = std::system(command.c_str());
    if (status == -1) {
        throwOsError("ERR_REFRESH_FAILED", "[Refresh] Failed to start \"" + command + "\"");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw OikosError("ERR_REFRESH_FAILED",
                         "[Refresh] \"" + command + "\" exited with status " +
                         std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : status));
    }
}

static void runLoop(const Options& options) {
    std::optional<Wake::Sleeper> sleeper;
    if (options.sleep) {
        sleeper.emplace(buildSleeper(*options.sleep));
    }

    for (;;) {
        // Wait for network before refreshing
        if (options.waitForNetwork) {
            Network::waitForNetwork(options.waitForNetwork->host, options.waitForNetwork->timeout);
        }

        if (!options.refreshCommand.empty()) {
            runRefresh(options.refreshCommand);
        }

        // Sleep or exit
        if (!sleeper) {
            break;
        }

        LOG_DEBUG("Main", "Sleeping for " + Timing::formatDuration(sleeper->duration()));
        Wake::WakeupReason reason = sleeper->wait();
        if (reason.isExitKey()) {
            LOG_DEBUG("Main", "Key " + reason.key.name() + " pressed. Exiting");
            break;
        }
    }
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    int exitCode = 0;

    try {
        Options options = runBootstrapChecks(argc, argv);
        initLogger(options.logFile);
        LOG_PHASE("Startup complete, entering main loop", true);

        runLoop(options);
        LOG_PHASE("Shutdown complete", true);
    } catch (const OikosError& e) {
        std::string userMsg = ErrorManager::report(e);
        std::cerr << userMsg << std::endl;
        LOG_PHASE("Shutdown after error", false);
        exitCode = 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Main", std::string("Unexpected error: ") + e.what());
        LOG_PHASE("Shutdown after error", false);
        exitCode = 1;
    }

    shutdownLogger();
    return exitCode;
}
