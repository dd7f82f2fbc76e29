#pragma once
#include <string>

namespace Power {

inline constexpr const char* kPowerStatePath = "/sys/power/state";

// Write "mem" to the power-state file. Returns after the system resumes.
// Throws OikosError(ERR_SUSPEND_WRITE) naming the path.
void suspendToRam(const std::string& statePath = kPowerStatePath);

} // namespace Power
