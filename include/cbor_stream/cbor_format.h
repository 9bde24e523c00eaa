#pragma once

#include "cbor_stream/cbor.h"

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <string_view>

template <> struct fmt::formatter<cbor::stream::major_type> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(cbor::stream::major_type type, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(magic_enum::enum_name(type), ctx);
    }
};

template <> struct fmt::formatter<cbor::stream::status_code> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(cbor::stream::status_code code, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(magic_enum::enum_name(code), ctx);
    }
};

template <> struct fmt::formatter<cbor::stream::length> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(const cbor::stream::length &len, FormatContext &ctx) const -> decltype(ctx.out()) {
        if (len.indefinite) {
            return fmt::format_to(ctx.out(), "indefinite");
        }
        return fmt::format_to(ctx.out(), "definite({})", len.value);
    }
};

// "<code>: <message> (<payload>)", the payload part only for kinds that carry one
template <> struct fmt::formatter<cbor::stream::decode_error> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const cbor::stream::decode_error &err, FormatContext &ctx) const -> decltype(ctx.out()) {
        using cbor::stream::status_code;
        auto out = fmt::format_to(ctx.out(), "{}: {}", err.code, cbor::stream::status_message(err.code));

        switch (err.code) {
        case status_code::insufficient_data:
            return fmt::format_to(out, " (available {}, requested {})", err.actual_value, err.expected_value);
        case status_code::source_error: return fmt::format_to(out, " ({})", err.context);
        case status_code::type_mismatch: return fmt::format_to(out, " (expected {}, got {})", err.expected_type, err.actual_type);
        case status_code::unknown_length_encoding: return fmt::format_to(out, " (0x{:02x})", err.actual_value);
        case status_code::indefinite_length_not_supported:
        case status_code::invalid_indefinite_string: return fmt::format_to(out, " ({})", err.actual_type);
        case status_code::wrong_length:
            return fmt::format_to(out, " ({}: expected {}, got {})", err.context, err.expected_value, err.actual_length);
        case status_code::integer_overflow: return fmt::format_to(out, " ({} does not fit {} bits)", err.actual_value, err.expected_value);
        case status_code::expected_set_tag: return fmt::format_to(out, " (got tag {})", err.actual_value);
        case status_code::unexpected_special: return fmt::format_to(out, " (wanted {})", err.context);
        default: return out;
        }
    }
};
