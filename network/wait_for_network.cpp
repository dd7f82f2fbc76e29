#include "wait_for_network.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <cpr/cpr.h>

namespace Network {

static constexpr std::chrono::seconds kProbeInterval{3};

void waitForNetwork(const std::string& host, Timing::Duration timeout) {
    LOG_DEBUG("Network", "Waiting for network with " + host);

    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout) {
        cpr::Response r = cpr::Get(cpr::Url{host},
                                   cpr::Timeout{std::chrono::duration_cast<std::chrono::milliseconds>(kProbeInterval)});
        if (r.error.code == cpr::ErrorCode::OK && r.status_code > 0 && r.status_code < 400) {
            LOG_DEBUG("Network", host + " reachable (HTTP " + std::to_string(r.status_code) + ")");
            return;
        }

        if (r.error.code != cpr::ErrorCode::OK) {
            LOG_DEBUG("Network", "Network probe failed: " + r.error.message);
        } else {
            LOG_DEBUG("Network", "Network probe failed: HTTP " + std::to_string(r.status_code));
        }
        auto remaining = timeout - (std::chrono::steady_clock::now() - start);
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            break;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kProbeInterval, remaining));
    }

    throw OikosError("ERR_NETWORK_TIMEOUT",
                     "[Network] Unable to reach host " + host + " after " + Timing::formatDuration(timeout));
}

} // namespace Network
