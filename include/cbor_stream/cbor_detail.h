#pragma once

#include "cbor_stream/cbor_concepts.h"
#include "cbor_stream/cbor_stream_config.h"
#include "cbor_stream/float16_ieee754.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace cbor::stream::detail {

template <typename T, typename ThisPtr> constexpr T &underlying(ThisPtr this_ptr) { return static_cast<T &>(*this_ptr); }

// Called from inside a decoder member, where plain `decode` would only see the member overloads
template <typename Decoder, typename C> inline constexpr auto adl_indirect_decode(Decoder &dec, C &c) { return decode(dec, c); }

// Declared lengths come from untrusted input, never reserve more than the configured cap
template <typename T> constexpr std::size_t reservation(std::uint64_t declared) noexcept {
    constexpr std::uint64_t cap = std::max<std::uint64_t>(1, CBOR_STREAM_MAX_PREALLOCATION / sizeof(T));
    return static_cast<std::size_t>(std::min<std::uint64_t>(declared, cap));
}

template <bool Ieee754> inline double float_from_bits(std::uint64_t bits, std::size_t width) noexcept {
    if constexpr (!Ieee754) {
        return static_cast<double>(bits);
    } else {
        switch (width) {
        case 2: return static_cast<double>(static_cast<float>(float16_t{static_cast<std::uint16_t>(bits)}));
        case 4: return static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(bits)));
        default: return std::bit_cast<double>(bits);
        }
    }
}

inline bool is_valid_utf8(std::string_view s) noexcept {
    const auto *p   = reinterpret_cast<const unsigned char *>(s.data());
    const auto  len = s.size();
    std::size_t i   = 0;

    while (i < len) {
        const auto c0 = p[i];
        if (c0 <= 0x7F) {
            ++i;
            continue;
        }

        auto cont = [&](std::size_t j) -> bool { return j < len && (p[j] & 0xC0u) == 0x80u; };

        if ((c0 & 0xE0u) == 0xC0u) {
            if (!cont(i + 1)) return false;
            const std::uint32_t cp = (std::uint32_t(c0 & 0x1Fu) << 6) | std::uint32_t(p[i + 1] & 0x3Fu);
            if (cp < 0x80u) return false; // overlong
            i += 2;
        } else if ((c0 & 0xF0u) == 0xE0u) {
            if (!cont(i + 1) || !cont(i + 2)) return false;
            const std::uint32_t cp = (std::uint32_t(c0 & 0x0Fu) << 12) | (std::uint32_t(p[i + 1] & 0x3Fu) << 6) |
                                     std::uint32_t(p[i + 2] & 0x3Fu);
            if (cp < 0x800u) return false;                     // overlong
            if (cp >= 0xD800u && cp <= 0xDFFFu) return false; // surrogates
            i += 3;
        } else if ((c0 & 0xF8u) == 0xF0u) {
            if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) return false;
            const std::uint32_t cp = (std::uint32_t(c0 & 0x07u) << 18) | (std::uint32_t(p[i + 1] & 0x3Fu) << 12) |
                                     (std::uint32_t(p[i + 2] & 0x3Fu) << 6) | std::uint32_t(p[i + 3] & 0x3Fu);
            if (cp < 0x10000u || cp > 0x10FFFFu) return false;
            i += 4;
        } else {
            return false;
        }
    }

    return true;
}

} // namespace cbor::stream::detail
