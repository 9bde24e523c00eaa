#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <variant>

namespace cbor::stream {

// Simple value without an assigned meaning, 0-19, 28-30 or the one byte extension (24)
struct simple {
    using value_type = std::uint8_t;
    value_type value;

    constexpr simple() = default;
    constexpr simple(value_type value) : value(value) {}

    constexpr auto operator<=>(const simple &) const = default;
    constexpr bool operator==(const simple &) const  = default;
};

struct undefined {
    constexpr bool operator==(const undefined &) const = default;
};

// 0xff, terminates indefinite length strings, arrays and maps
struct break_marker {
    constexpr bool operator==(const break_marker &) const = default;
};

// Everything major type 7 can carry: bool, null, undefined, float, break and unassigned codes
using special_value = std::variant<bool, std::nullptr_t, undefined, double, break_marker, simple>;

} // namespace cbor::stream
