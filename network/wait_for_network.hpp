#pragma once
#include <string>

#include "timer/duration.hpp"

namespace Network {

// Probe `host` with HTTP GET every 3 s until it answers (status < 400).
// Throws OikosError(ERR_NETWORK_TIMEOUT) once `timeout` has elapsed.
void waitForNetwork(const std::string& host, Timing::Duration timeout);

} // namespace Network
