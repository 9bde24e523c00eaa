#pragma once
#include "cbor_stream/cbor.h"
#include "cbor_stream/cbor_format.h"

#include <cstddef>
#include <doctest/doctest.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <magic_enum/magic_enum.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tl/expected.hpp>
#include <vector>

template <typename T> inline std::string to_hex(const T &bytes) {
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        fmt::format_to(std::back_inserter(hex), "{:02x}", static_cast<unsigned>(b));
    }
    return hex;
}

template <typename byte = std::byte>
    requires(sizeof(byte) == 1)
inline std::vector<byte> to_bytes(std::string_view hex) {
    if (hex.length() % 2 != 0) {
        return {};
    }

    std::vector<byte> bytes;
    bytes.reserve(hex.length() / 2);

    auto byte_to_int = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = byte_to_int(hex[i]);
        int low  = byte_to_int(hex[i + 1]);
        bytes.push_back(static_cast<byte>((high << 4) | low));
    }

    return bytes;
}

// Print using fmt
inline auto print_bytes = [](const std::vector<std::byte> &bytes) { fmt::print("{}\n", to_hex(bytes)); };

namespace doctest {
template <> struct StringMaker<cbor::stream::status_code> {
    static String convert(cbor::stream::status_code code) { return String(std::string(magic_enum::enum_name(code)).c_str()); }
};

template <> struct StringMaker<cbor::stream::major_type> {
    static String convert(cbor::stream::major_type type) { return String(std::string(magic_enum::enum_name(type)).c_str()); }
};

template <> struct StringMaker<cbor::stream::length> {
    static String convert(const cbor::stream::length &len) { return String(fmt::format("{}", len).c_str()); }
};

template <> struct StringMaker<cbor::stream::decode_error> {
    static String convert(const cbor::stream::decode_error &err) { return String(fmt::format("{}", err).c_str()); }
};

template <typename T> struct StringMaker<tl::expected<T, cbor::stream::decode_error>> {
    static String convert(const tl::expected<T, cbor::stream::decode_error> &value) {
        if (value.has_value()) {
            return "expected(has_value)";
        } else {
            return String(fmt::format("unexpected({})", value.error()).c_str());
        }
    }
};

} // namespace doctest
