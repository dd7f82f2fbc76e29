#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <linux/input-event-codes.h>

namespace Evdev {

// ------------------------------------------------------------
// KeyCode: a key/button code from the kernel's EV_KEY code space
// ------------------------------------------------------------
class KeyCode {
public:
    // Length of the kernel key-code table (size of the EV_KEY bitmask)
    static constexpr std::size_t COUNT = KEY_CNT;

    constexpr KeyCode() = default;
    constexpr explicit KeyCode(std::uint16_t code) : code_(code) {}

    constexpr std::uint16_t code() const { return code_; }

    // Accepts a symbolic name ("KEY_HOME", "BTN_LEFT") or a decimal code.
    static std::optional<KeyCode> parse(const std::string& text);

    // Symbolic name, or "KEY_UNKNOWN(<code>)" for codes outside the table.
    std::string name() const;

    friend constexpr bool operator==(KeyCode a, KeyCode b) { return a.code_ == b.code_; }
    friend constexpr bool operator!=(KeyCode a, KeyCode b) { return a.code_ != b.code_; }
    friend constexpr bool operator<(KeyCode a, KeyCode b) { return a.code_ < b.code_; }
    friend constexpr bool operator>(KeyCode a, KeyCode b) { return a.code_ > b.code_; }
    friend constexpr bool operator<=(KeyCode a, KeyCode b) { return a.code_ <= b.code_; }
    friend constexpr bool operator>=(KeyCode a, KeyCode b) { return a.code_ >= b.code_; }

private:
    std::uint16_t code_ = 0;
};

std::ostream& operator<<(std::ostream& os, KeyCode key);

} // namespace Evdev
