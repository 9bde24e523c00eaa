#pragma once

#include "cbor_stream/cbor.h"
#include "cbor_stream/cbor_simple.h"

#include <cmath>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <variant>

namespace cbor::stream {

// RFC 8949 section 8 spelling: a float always shows a fraction or an exponent, so 1.0 never reads as the integer 1
inline void format_float(double value, fmt::memory_buffer &out) {
    if (std::isnan(value)) {
        fmt::format_to(std::back_inserter(out), "NaN");
        return;
    }
    if (std::isinf(value)) {
        fmt::format_to(std::back_inserter(out), "{}", value < 0 ? "-Infinity" : "Infinity");
        return;
    }

    const auto start = out.size();
    fmt::format_to(std::back_inserter(out), "{}", value);
    const std::string_view text(out.data() + start, out.size() - start);
    if (text.find_first_of(".e") == std::string_view::npos) {
        fmt::format_to(std::back_inserter(out), ".0");
    }
}

template <typename Decoder> expected<void> diagnostic_notation(Decoder &dec, fmt::memory_buffer &out);

namespace detail {

template <typename Decoder> expected<void> diagnose_array(Decoder &dec, fmt::memory_buffer &out) {
    auto len = dec.array();
    if (!len) {
        return unexpected<decode_error>(len.error());
    }
    fmt::format_to(std::back_inserter(out), "{}", len->indefinite ? "[_ " : "[");

    bool first = true;
    auto items = dec.items_with(*len, [&](auto &d) -> expected<void> {
        if (!first) {
            fmt::format_to(std::back_inserter(out), ", ");
        }
        first = false;
        return diagnostic_notation(d, out);
    });
    if (!items) {
        return items;
    }
    fmt::format_to(std::back_inserter(out), "]");
    return {};
}

template <typename Decoder> expected<void> diagnose_map(Decoder &dec, fmt::memory_buffer &out) {
    auto len = dec.map();
    if (!len) {
        return unexpected<decode_error>(len.error());
    }
    fmt::format_to(std::back_inserter(out), "{}", len->indefinite ? "{_ " : "{");

    bool first = true;
    auto pairs = dec.items_with(*len, [&](auto &d) -> expected<void> {
        if (!first) {
            fmt::format_to(std::back_inserter(out), ", ");
        }
        first = false;
        if (auto key = diagnostic_notation(d, out); !key) {
            return key;
        }
        fmt::format_to(std::back_inserter(out), ": ");
        return diagnostic_notation(d, out);
    });
    if (!pairs) {
        return pairs;
    }
    fmt::format_to(std::back_inserter(out), "}}");
    return {};
}

template <typename Decoder> expected<void> diagnose_special(Decoder &dec, fmt::memory_buffer &out) {
    auto value = dec.special();
    if (!value) {
        return unexpected<decode_error>(value.error());
    }
    // Breaks belong to the enclosing indefinite item, a stray one is malformed
    if (std::holds_alternative<break_marker>(*value)) {
        return unexpected<decode_error>(decode_error::unexpected_special("data item"));
    }

    std::visit(
        [&out](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                fmt::format_to(std::back_inserter(out), "{}", v);
            } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
                fmt::format_to(std::back_inserter(out), "null");
            } else if constexpr (std::is_same_v<T, undefined>) {
                fmt::format_to(std::back_inserter(out), "undefined");
            } else if constexpr (std::is_same_v<T, double>) {
                format_float(v, out);
            } else if constexpr (std::is_same_v<T, simple>) {
                fmt::format_to(std::back_inserter(out), "simple({})", v.value);
            }
        },
        *value);
    return {};
}

} // namespace detail

// Appends the diagnostic notation of the next item, reading it with the primitive readers only.
// On failure `out` holds the text of whatever was complete before the error.
template <typename Decoder> expected<void> diagnostic_notation(Decoder &dec, fmt::memory_buffer &out) {
    auto type = dec.cbor_type();
    if (!type) {
        return unexpected<decode_error>(type.error());
    }

    switch (*type) {
    case major_type::UnsignedInteger: {
        auto value = dec.unsigned_integer();
        if (!value) {
            return unexpected<decode_error>(value.error());
        }
        fmt::format_to(std::back_inserter(out), "{}", *value);
        return {};
    }
    case major_type::NegativeInteger: {
        auto value = dec.negative_integer();
        if (!value) {
            return unexpected<decode_error>(value.error());
        }
        fmt::format_to(std::back_inserter(out), "{}", *value);
        return {};
    }
    case major_type::ByteString: {
        auto value = dec.bytes();
        if (!value) {
            return unexpected<decode_error>(value.error());
        }
        fmt::format_to(std::back_inserter(out), "h'");
        for (auto b : *value) {
            fmt::format_to(std::back_inserter(out), "{:02x}", std::to_integer<unsigned>(b));
        }
        fmt::format_to(std::back_inserter(out), "'");
        return {};
    }
    case major_type::TextString: {
        auto value = dec.text();
        if (!value) {
            return unexpected<decode_error>(value.error());
        }
        fmt::format_to(std::back_inserter(out), "{:?}", *value);
        return {};
    }
    case major_type::Array: return detail::diagnose_array(dec, out);
    case major_type::Map: return detail::diagnose_map(dec, out);
    case major_type::Tag: {
        auto value = dec.tag();
        if (!value) {
            return unexpected<decode_error>(value.error());
        }
        fmt::format_to(std::back_inserter(out), "{}(", *value);
        if (auto item = diagnostic_notation(dec, out); !item) {
            return item;
        }
        fmt::format_to(std::back_inserter(out), ")");
        return {};
    }
    case major_type::Simple: return detail::diagnose_special(dec, out);
    }
    return {};
}

} // namespace cbor::stream
