#pragma once

#include <tl/expected.hpp>

#include "cbor_stream/cbor_concepts.h"
#include "cbor_stream/cbor_simple.h"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cbor::stream {

// Status/Error handling
enum class status_code : std::uint8_t {
    // Success state
    success,

    // Input errors
    insufficient_data, // Source ran dry in the middle of a value
    source_error,      // The underlying stream reported a failure
    trailing_data,     // decode_complete found bytes after the value

    // Header errors
    type_mismatch,                   // Major type differs from what the reader expects
    unknown_length_encoding,         // Reserved additional info 28-30
    indefinite_length_not_supported, // 0x1f on an integer or a tag

    // Data format errors
    invalid_indefinite_string, // Chunk of an indefinite string is itself indefinite
    invalid_utf8_sequence,     // Text chunk is not valid UTF-8
    wrong_length,              // Fixed arity array or optional got another length
    integer_overflow,          // Value does not fit the target integer width
    expected_set_tag,          // Tag present but it is not 258
    unexpected_special         // Major type 7 value of the wrong kind, e.g. null for a bool
};

constexpr std::string_view status_message(status_code s) {
    switch (s) {
    case status_code::success: return "Success";

    case status_code::insufficient_data: return "Input ended unexpectedly while reading CBOR data";
    case status_code::source_error: return "Underlying byte source failed";
    case status_code::trailing_data: return "Unconsumed bytes after the decoded value";

    case status_code::type_mismatch: return "CBOR major type doesn't match the expected type";
    case status_code::unknown_length_encoding: return "Reserved length encoding (additional info 28-30)";
    case status_code::indefinite_length_not_supported: return "Indefinite length is not allowed for this major type";

    case status_code::invalid_indefinite_string: return "Chunk of an indefinite length string is itself indefinite";
    case status_code::invalid_utf8_sequence: return "Text string contains invalid UTF-8 sequence";
    case status_code::wrong_length: return "Array length doesn't match the expected count";
    case status_code::integer_overflow: return "Integer doesn't fit the target type";
    case status_code::expected_set_tag: return "Expected the set tag (258)";
    case status_code::unexpected_special: return "Major type 7 value of an unexpected kind";

    default: return "Unknown CBOR status code";
    }
}

inline constexpr std::uint64_t set_tag_value = 258;

// Length of a string or collection, or the value of an integer or tag header
struct length {
    std::uint64_t value{0};
    bool          indefinite{false};

    constexpr bool is_definite() const noexcept { return !indefinite; }
    constexpr bool operator==(const length &) const = default;
};

constexpr length definite_length(std::uint64_t n) noexcept { return length{n, false}; }

inline constexpr length indefinite_length{0, true};

// Failure kind plus whatever payload that kind reports. Unused fields stay zero.
struct decode_error {
    status_code      code{status_code::success};
    std::uint64_t    expected_value{0}; // bytes needed, expected length, integer width in bits, wanted tag
    std::uint64_t    actual_value{0};   // bytes available, offending byte or value, actual tag
    major_type       expected_type{major_type::UnsignedInteger};
    major_type       actual_type{major_type::UnsignedInteger};
    length           actual_length{};
    std::string_view context{};

    constexpr bool operator==(const decode_error &) const = default;

    static constexpr decode_error insufficient_data(std::uint64_t have, std::uint64_t need) noexcept {
        return {.code = status_code::insufficient_data, .expected_value = need, .actual_value = have};
    }
    static constexpr decode_error source_error(std::string_view what) noexcept {
        return {.code = status_code::source_error, .context = what};
    }
    static constexpr decode_error trailing_data() noexcept { return {.code = status_code::trailing_data}; }
    static constexpr decode_error type_mismatch(major_type expected, major_type actual) noexcept {
        return {.code = status_code::type_mismatch, .expected_type = expected, .actual_type = actual};
    }
    static constexpr decode_error unknown_length_encoding(std::uint8_t additional_info) noexcept {
        return {.code = status_code::unknown_length_encoding, .actual_value = additional_info};
    }
    static constexpr decode_error indefinite_length_not_supported(major_type type) noexcept {
        return {.code = status_code::indefinite_length_not_supported, .expected_type = type, .actual_type = type};
    }
    static constexpr decode_error invalid_indefinite_string(major_type type) noexcept {
        return {.code = status_code::invalid_indefinite_string, .expected_type = type, .actual_type = type};
    }
    static constexpr decode_error invalid_utf8_sequence() noexcept { return {.code = status_code::invalid_utf8_sequence}; }
    static constexpr decode_error wrong_length(std::uint64_t expected, length actual, std::string_view where) noexcept {
        return {.code = status_code::wrong_length, .expected_value = expected, .actual_length = actual, .context = where};
    }
    static constexpr decode_error integer_overflow(std::uint64_t width, std::uint64_t value) noexcept {
        return {.code = status_code::integer_overflow, .expected_value = width, .actual_value = value};
    }
    static constexpr decode_error expected_set_tag(std::uint64_t tag) noexcept {
        return {.code = status_code::expected_set_tag, .expected_value = set_tag_value, .actual_value = tag};
    }
    static constexpr decode_error unexpected_special(std::string_view wanted) noexcept {
        return {.code = status_code::unexpected_special, .expected_type = major_type::Simple, .actual_type = major_type::Simple,
                .context = wanted};
    }
};

// TODO: use std::expected when available
template <typename T> using expected = tl::expected<T, decode_error>;
template <typename E> using unexpected = tl::unexpected<E>;

template <typename T> struct Option {
    using is_options = void;
    using type       = T;
};

// Reinterpret float payloads as plain integers converted to double, as older decoders did
struct legacy_integer_floats {};

template <typename... T> struct Options {
    using is_options = void;

    // When false, 0xf9/0xfa/0xfb payloads are numerically cast instead of read as IEEE-754
    static constexpr bool ieee754_floats = !contains<Option<legacy_integer_floats>, T...>();

    constexpr Options() = default;
};

using default_options = Options<>;
using legacy_options  = Options<Option<legacy_integer_floats>>;

// Header for a fixed arity record, e.g. dec(as_tuple{2, "point"}, x, y)
struct as_tuple {
    std::uint64_t    size_;
    std::string_view context_;
    explicit constexpr as_tuple(std::uint64_t size, std::string_view context = "tuple") : size_(size), context_(context) {}
};

} // namespace cbor::stream
