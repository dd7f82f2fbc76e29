#pragma once
#include <chrono>
#include <string>

namespace Timing {

using Duration = std::chrono::milliseconds;

// Parse "<n><unit>..." with units ms, s, m, h, d ("90s", "1h30m", "250ms").
// A bare integer means seconds. Throws OikosError(ERR_CONFIG_INVALID).
Duration parseDuration(const std::string& text);

// Compact inverse of parseDuration, used in log and error messages.
std::string formatDuration(Duration d);

} // namespace Timing
