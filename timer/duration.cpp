#include "duration.hpp"
#include "error_manager.hpp"

#include <cctype>
#include <limits>

namespace Timing {

// ------------------------------------------------------------
// Parse a human duration string
// ------------------------------------------------------------
Duration parseDuration(const std::string& text) {
    auto invalid = [&text]() {
        return OikosError("ERR_CONFIG_INVALID", "[Config] Invalid duration: \"" + text + "\"");
    };

    if (text.empty()) {
        throw invalid();
    }

    const long long maxMs = std::numeric_limits<Duration::rep>::max();
    long long totalMs = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw invalid();
        }

        long long value = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            if (value > (maxMs - 9) / 10) {
                throw invalid();
            }
            value = value * 10 + (text[i] - '0');
            i++;
        }

        size_t unitStart = i;
        while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
            i++;
        }
        std::string unit = text.substr(unitStart, i - unitStart);

        long long scale = 0;
        if (unit.empty() && unitStart == text.size() && totalMs == 0) scale = 1000;
        else if (unit == "ms") scale = 1;
        else if (unit == "s")  scale = 1000;
        else if (unit == "m")  scale = 60 * 1000;
        else if (unit == "h")  scale = 60 * 60 * 1000;
        else if (unit == "d")  scale = 24 * 60 * 60 * 1000;
        else throw invalid();

        if (value > (maxMs - totalMs) / scale) {
            throw invalid();
        }
        totalMs += value * scale;
    }

    return Duration(totalMs);
}

// ------------------------------------------------------------
// Format for messages
// ------------------------------------------------------------
std::string formatDuration(Duration d) {
    long long ms = d.count();
    if (ms == 0) return "0s";

    std::string out;
    if (ms < 0) {
        out = "-";
        ms = -ms;
    }

    const struct { long long scale; const char* unit; } parts[] = {
        { 24LL * 60 * 60 * 1000, "d" },
        { 60LL * 60 * 1000, "h" },
        { 60LL * 1000, "m" },
        { 1000LL, "s" },
        { 1LL, "ms" },
    };
    for (const auto& part : parts) {
        if (ms >= part.scale) {
            out += std::to_string(ms / part.scale) + part.unit;
            ms %= part.scale;
        }
    }
    return out;
}

} // namespace Timing
