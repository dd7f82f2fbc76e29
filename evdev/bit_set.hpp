#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Evdev {

// Byte-packed bitmask as returned by EVIOCGBIT (bit n = byte n/8, bit n%8).
class BitSet {
public:
    explicit BitSet(std::size_t bits) : bytes_(bits / 8 + 1, 0) {}

    bool isSet(std::size_t bit) const {
        if (bit / 8 >= bytes_.size()) return false;
        return (bytes_[bit / 8] & (1u << (bit % 8))) != 0;
    }

    void set(std::size_t bit) {
        if (bit / 8 < bytes_.size()) {
            bytes_[bit / 8] |= static_cast<std::uint8_t>(1u << (bit % 8));
        }
    }

    std::uint8_t* data() { return bytes_.data(); }
    const std::uint8_t* data() const { return bytes_.data(); }
    std::size_t size() const { return bytes_.size(); }

private:
    std::vector<std::uint8_t> bytes_;
};

} // namespace Evdev
