#pragma once

#include <cmath>
#include <cstdint>
#include <limits>

namespace cbor::stream {

// IEEE-754 binary16 as it appears on the wire, widened on demand
struct float16_t {
    std::uint16_t value;

    float16_t() = default;
    constexpr explicit float16_t(std::uint16_t bits) : value(bits) {}

    operator float() const {
        const unsigned exp  = (value >> 10) & 0x1f;
        const unsigned mant = value & 0x3ff;
        float          val;

        if (exp == 0) {
            val = std::ldexp(static_cast<float>(mant), -24);
        } else if (exp != 31) {
            val = std::ldexp(static_cast<float>(mant + 1024), static_cast<int>(exp) - 25);
        } else {
            val = mant == 0 ? std::numeric_limits<float>::infinity() : std::numeric_limits<float>::quiet_NaN();
        }

        return (value & 0x8000) ? -val : val;
    }
};

} // namespace cbor::stream
