#pragma once

#include "cbor_stream/cbor.h"
#include "cbor_stream/cbor_concepts.h"
#include "cbor_stream/cbor_detail.h"
#include "cbor_stream/cbor_format.h"
#include "cbor_stream/cbor_simple.h"
#include "cbor_stream/cbor_source.h"
#include "cbor_stream/cbor_stream_config.h"
#include "cbor_stream/cbor_window.h"

#include <nameof.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cbor::stream {

template <typename T> struct cbor_header_decoder;
template <typename T> struct cbor_integer_decoder;
template <typename T> struct cbor_simple_decoder;
template <typename T> struct cbor_string_decoder;
template <typename T> struct cbor_range_decoder;
template <typename T> struct cbor_optional_decoder;
template <typename T> struct cbor_fixed_array_decoder;
template <typename T> struct cbor_class_decoder;

// Pull decoder over one byte source. It keeps no state besides the read position of its window, so any sequence of
// primitive reads and typed decodes can be mixed freely. After an error the position is unspecified.
template <ByteSource Source, IsOptions Options, template <typename> typename... Decoders>
struct decoder : public Decoders<decoder<Source, Options, Decoders...>>... {
    using self_t = decoder<Source, Options, Decoders...>;
    using Decoders<self_t>::decode...;

    using source_type = Source;
    using options     = Options;
    using byte        = std::byte;

    explicit decoder(Source source) : window_(std::move(source)) {}

    /*
     * Header
     */

    // Major type of the next item, nothing is consumed
    expected<major_type> cbor_type() {
        auto initial = window_.peek(0);
        if (!initial) {
            return unexpected<decode_error>(initial.error());
        }
        return major_type_of(*initial);
    }

    expected<void> expect_type(major_type wanted) {
        auto actual = cbor_type();
        if (!actual) {
            return unexpected<decode_error>(actual.error());
        }
        if (*actual != wanted) {
            return unexpected<decode_error>(decode_error::type_mismatch(wanted, *actual));
        }
        return {};
    }

    // Length field of the next item and how many bytes after the initial byte encode it. Nothing is consumed.
    // For integers and tags the definite length is the value itself.
    expected<std::pair<length, std::size_t>> cbor_len() {
        auto initial = window_.peek(0);
        if (!initial) {
            return unexpected<decode_error>(initial.error());
        }

        const auto info = static_cast<std::uint8_t>(std::to_integer<std::uint8_t>(*initial) & 0x1f);
        if (info < 0x18) {
            return std::pair{definite_length(info), std::size_t{0}};
        }

        switch (info) {
        case 0x18:
        case 0x19:
        case 0x1a:
        case 0x1b: {
            const auto width = std::size_t{1} << (info - 0x18);
            auto       value = peek_big_endian(1, width);
            if (!value) {
                return unexpected<decode_error>(value.error());
            }
            return std::pair{definite_length(*value), width};
        }
        case 0x1f: return std::pair{indefinite_length, std::size_t{0}};
        default: return unexpected<decode_error>(decode_error::unknown_length_encoding(info));
        }
    }

    // Skipped bytes are gone for good
    void advance(std::size_t n) { window_.consume(n); }

    /*
     * Primitive readers
     */

    expected<std::uint64_t> unsigned_integer() { return definite_header(major_type::UnsignedInteger); }

    expected<std::int64_t> negative_integer() {
        auto magnitude = definite_header(major_type::NegativeInteger);
        if (!magnitude) {
            return unexpected<decode_error>(magnitude.error());
        }
        if (*magnitude > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return unexpected<decode_error>(decode_error::integer_overflow(64, *magnitude));
        }
        // -1 - v
        return static_cast<std::int64_t>(~*magnitude);
    }

    expected<std::vector<std::byte>> bytes() {
        std::vector<std::byte> out;
        auto                   result = string_chunks(major_type::ByteString, [this, &out](std::uint64_t n) {
            if (out.empty()) {
                out.reserve(detail::reservation<std::byte>(n));
            }
            return window_.read_exact(n, [&out](std::span<const std::byte> piece) { out.insert(out.end(), piece.begin(), piece.end()); });
        });
        if (!result) {
            return unexpected<decode_error>(result.error());
        }
        return out;
    }

    // Every chunk must be valid UTF-8 on its own, a code point may not straddle two chunks
    expected<std::string> text() {
        std::string out;
        std::string chunk;
        auto        result = string_chunks(major_type::TextString, [this, &out, &chunk](std::uint64_t n) -> expected<void> {
            chunk.clear();
            chunk.reserve(detail::reservation<char>(n));
            auto read = window_.read_exact(
                n, [&chunk](std::span<const std::byte> piece) { chunk.append(reinterpret_cast<const char *>(piece.data()), piece.size()); });
            if (!read) {
                return read;
            }
            if (!detail::is_valid_utf8(chunk)) {
                return unexpected<decode_error>(decode_error::invalid_utf8_sequence());
            }
            out += chunk;
            return {};
        });
        if (!result) {
            return unexpected<decode_error>(result.error());
        }
        return out;
    }

    // Header only, the caller reads the elements
    expected<length> array() { return collection_header(major_type::Array); }
    expected<length> map() { return collection_header(major_type::Map); }

    // f(decoder&) -> expected<void> once per element
    template <typename F> expected<void> array_with(F &&f) {
        auto len = array();
        if (!len) {
            return unexpected<decode_error>(len.error());
        }
        return items_with(*len, std::forward<F>(f));
    }

    // f(decoder&) -> expected<void> once per pair, f reads the key and then the value
    template <typename F> expected<void> map_with(F &&f) {
        auto len = map();
        if (!len) {
            return unexpected<decode_error>(len.error());
        }
        return items_with(*len, std::forward<F>(f));
    }

    // Definite: exactly len calls. Indefinite: calls until a break marker, which is consumed.
    template <typename F> expected<void> items_with(length len, F &&f) {
        if (len.is_definite()) {
            for (std::uint64_t i = 0; i < len.value; ++i) {
                if (auto item = f(*this); !item) {
                    return unexpected<decode_error>(item.error());
                }
            }
            return {};
        }

        while (true) {
            auto done = next_is_break();
            if (!done) {
                return unexpected<decode_error>(done.error());
            }
            if (*done) {
                return {};
            }
            if (auto item = f(*this); !item) {
                return unexpected<decode_error>(item.error());
            }
        }
    }

    expected<void> tuple(std::uint64_t expected_len, std::string_view context) {
        auto len = array();
        if (!len) {
            return unexpected<decode_error>(len.error());
        }
        if (*len != definite_length(expected_len)) {
            return unexpected<decode_error>(decode_error::wrong_length(expected_len, *len, context));
        }
        return {};
    }

    // Tag number only, the tagged item follows
    expected<std::uint64_t> tag() { return definite_header(major_type::Tag); }

    expected<void> set_tag() {
        auto value = tag();
        if (!value) {
            return unexpected<decode_error>(value.error());
        }
        if (*value != set_tag_value) {
            return unexpected<decode_error>(decode_error::expected_set_tag(*value));
        }
        return {};
    }

    // Consumes the next byte only if it is a break marker
    expected<bool> special_break() {
        if (auto ok = expect_type(major_type::Simple); !ok) {
            return unexpected<decode_error>(ok.error());
        }
        auto initial = window_.peek(0);
        if (!initial) {
            return unexpected<decode_error>(initial.error());
        }
        if ((std::to_integer<std::uint8_t>(*initial) & 0x1f) != 0x1f) {
            return false;
        }
        advance(1);
        return true;
    }

    expected<special_value> special() {
        if (auto ok = expect_type(major_type::Simple); !ok) {
            return unexpected<decode_error>(ok.error());
        }
        auto initial = window_.peek(0);
        if (!initial) {
            return unexpected<decode_error>(initial.error());
        }

        const auto info = static_cast<std::uint8_t>(std::to_integer<std::uint8_t>(*initial) & 0x1f);
        switch (info) {
        case 0x14: advance(1); return special_value{std::in_place_type<bool>, false};
        case 0x15: advance(1); return special_value{std::in_place_type<bool>, true};
        case 0x16: advance(1); return special_value{std::in_place_type<std::nullptr_t>, nullptr};
        case 0x17: advance(1); return special_value{std::in_place_type<undefined>};
        case 0x18: {
            auto code = peek_big_endian(1, 1);
            if (!code) {
                return unexpected<decode_error>(code.error());
            }
            advance(2);
            return special_value{std::in_place_type<simple>, static_cast<simple::value_type>(*code)};
        }
        case 0x19:
        case 0x1a:
        case 0x1b: {
            const auto width = std::size_t{1} << (info - 0x18);
            auto       bits  = peek_big_endian(1, width);
            if (!bits) {
                return unexpected<decode_error>(bits.error());
            }
            advance(1 + width);
            return special_value{std::in_place_type<double>, detail::float_from_bits<Options::ieee754_floats>(*bits, width)};
        }
        case 0x1f: advance(1); return special_value{std::in_place_type<break_marker>};
        default:
            // 0x00-0x13 and 0x1c-0x1e
            advance(1);
            return special_value{std::in_place_type<simple>, info};
        }
    }

    expected<bool> boolean() {
        auto value = special();
        if (!value) {
            return unexpected<decode_error>(value.error());
        }
        if (const auto *b = std::get_if<bool>(&*value)) {
            return *b;
        }
        return unexpected<decode_error>(decode_error::unexpected_special("bool"));
    }

    /*
     * Typed decoding
     */

    // One value of V, trailing bytes stay in the source
    template <typename V> expected<V> decode() {
        V    value{};
        auto result = decode(value);
        if (!result) {
            debug::println("decode<{}> failed: {}", nameof::nameof_type<V>(), result.error());
            return unexpected<decode_error>(result.error());
        }
        return value;
    }

    // One value of V that must span the rest of the input
    template <typename V> expected<V> decode_complete() {
        auto value = decode<V>();
        if (!value) {
            return value;
        }
        auto done = window_.exhausted();
        if (!done) {
            return unexpected<decode_error>(done.error());
        }
        if (!*done) {
            debug::println("decode_complete<{}>: unconsumed bytes left", nameof::nameof_type<V>());
            return unexpected<decode_error>(decode_error::trailing_data());
        }
        return value;
    }

    // Decodes each argument in order and stops at the first failure
    template <typename... Args> expected<void> operator()(Args &&...args) {
        expected<void> result{};
        ((result = decode(args), result.has_value()) && ...);
        return result;
    }

    expected<bool> exhausted() { return window_.exhausted(); }

    Source       &source() noexcept { return window_.source(); }
    const Source &source() const noexcept { return window_.source(); }
    Source        release() && { return std::move(window_).release(); }

  private:
    expected<std::uint64_t> peek_big_endian(std::size_t offset, std::size_t width) {
        std::uint64_t value = 0;
        for (std::size_t i = 0; i < width; ++i) {
            auto b = window_.peek(offset + i);
            if (!b) {
                return unexpected<decode_error>(b.error());
            }
            value = (value << 8) | std::to_integer<std::uint64_t>(*b);
        }
        return value;
    }

    // Integers and tags, indefinite is an error
    expected<std::uint64_t> definite_header(major_type type) {
        if (auto ok = expect_type(type); !ok) {
            return unexpected<decode_error>(ok.error());
        }
        auto header = cbor_len();
        if (!header) {
            return unexpected<decode_error>(header.error());
        }
        const auto [len, extra] = *header;
        if (!len.is_definite()) {
            return unexpected<decode_error>(decode_error::indefinite_length_not_supported(type));
        }
        advance(1 + extra);
        return len.value;
    }

    expected<length> collection_header(major_type type) {
        if (auto ok = expect_type(type); !ok) {
            return unexpected<decode_error>(ok.error());
        }
        auto header = cbor_len();
        if (!header) {
            return unexpected<decode_error>(header.error());
        }
        advance(1 + header->second);
        return header->first;
    }

    // on_chunk(n) -> expected<void> reads the n payload bytes of every definite piece
    template <typename OnChunk> expected<void> string_chunks(major_type type, OnChunk &&on_chunk) {
        auto len = collection_header(type);
        if (!len) {
            return unexpected<decode_error>(len.error());
        }
        if (len->is_definite()) {
            return on_chunk(len->value);
        }

        while (true) {
            auto done = next_is_break();
            if (!done) {
                return unexpected<decode_error>(done.error());
            }
            if (*done) {
                return {};
            }

            if (auto ok = expect_type(type); !ok) {
                return ok;
            }
            auto chunk = cbor_len();
            if (!chunk) {
                return unexpected<decode_error>(chunk.error());
            }
            if (!chunk->first.is_definite()) {
                return unexpected<decode_error>(decode_error::invalid_indefinite_string(type));
            }
            advance(1 + chunk->second);
            if (auto ok = on_chunk(chunk->first.value); !ok) {
                return ok;
            }
        }
    }

    // Break markers are only looked for where the next item is a major type 7 value
    expected<bool> next_is_break() {
        auto next = cbor_type();
        if (!next) {
            return unexpected<decode_error>(next.error());
        }
        if (*next != major_type::Simple) {
            return false;
        }
        return special_break();
    }

    byte_window<Source> window_;
};

template <typename T> struct cbor_header_decoder {
    expected<void> decode(as_tuple value) { return detail::underlying<T>(this).tuple(value.size_, value.context_); }
};

template <typename T> struct cbor_integer_decoder {
    template <IsUnsigned U> expected<void> decode(U &value) {
        auto &self = detail::underlying<T>(this);
        auto  raw  = self.unsigned_integer();
        if (!raw) {
            return unexpected<decode_error>(raw.error());
        }
        if (*raw > static_cast<std::uint64_t>(std::numeric_limits<U>::max())) {
            return unexpected<decode_error>(decode_error::integer_overflow(sizeof(U) * 8, *raw));
        }
        value = static_cast<U>(*raw);
        return {};
    }

    template <IsSigned S> expected<void> decode(S &value) {
        auto &self  = detail::underlying<T>(this);
        auto  major = self.cbor_type();
        if (!major) {
            return unexpected<decode_error>(major.error());
        }

        if (*major == major_type::UnsignedInteger) {
            auto raw = self.unsigned_integer();
            if (!raw) {
                return unexpected<decode_error>(raw.error());
            }
            if (*raw > static_cast<std::uint64_t>(std::numeric_limits<S>::max())) {
                return unexpected<decode_error>(decode_error::integer_overflow(sizeof(S) * 8, *raw));
            }
            value = static_cast<S>(*raw);
            return {};
        }

        if (*major == major_type::NegativeInteger) {
            auto raw = self.negative_integer();
            if (!raw) {
                return unexpected<decode_error>(raw.error());
            }
            if (*raw < static_cast<std::int64_t>(std::numeric_limits<S>::min())) {
                return unexpected<decode_error>(decode_error::integer_overflow(sizeof(S) * 8, static_cast<std::uint64_t>(-1 - *raw)));
            }
            value = static_cast<S>(*raw);
            return {};
        }

        return unexpected<decode_error>(decode_error::type_mismatch(major_type::UnsignedInteger, *major));
    }

    expected<void> decode(std::byte &value) {
        std::uint8_t raw{};
        if (auto ok = decode(raw); !ok) {
            return ok;
        }
        value = static_cast<std::byte>(raw);
        return {};
    }
};

template <typename T> struct cbor_simple_decoder {
    expected<void> decode(bool &value) {
        auto result = detail::underlying<T>(this).boolean();
        if (!result) {
            return unexpected<decode_error>(result.error());
        }
        value = *result;
        return {};
    }

    expected<void> decode(special_value &value) {
        auto result = detail::underlying<T>(this).special();
        if (!result) {
            return unexpected<decode_error>(result.error());
        }
        value = *result;
        return {};
    }

    expected<void> decode(double &value) {
        auto result = detail::underlying<T>(this).special();
        if (!result) {
            return unexpected<decode_error>(result.error());
        }
        if (const auto *d = std::get_if<double>(&*result)) {
            value = *d;
            return {};
        }
        return unexpected<decode_error>(decode_error::unexpected_special("float"));
    }
};

template <typename T> struct cbor_string_decoder {
    template <IsTextString S> expected<void> decode(S &value) {
        auto text = detail::underlying<T>(this).text();
        if (!text) {
            return unexpected<decode_error>(text.error());
        }
        if constexpr (std::is_same_v<S, std::string>) {
            value = std::move(*text);
        } else {
            value = S(text->cbegin(), text->cend());
        }
        return {};
    }

    template <IsByteString S> expected<void> decode(S &value) {
        auto bytes = detail::underlying<T>(this).bytes();
        if (!bytes) {
            return unexpected<decode_error>(bytes.error());
        }
        if constexpr (std::is_same_v<S, std::vector<std::byte>>) {
            value = std::move(*bytes);
        } else {
            value = S(bytes->cbegin(), bytes->cend());
        }
        return {};
    }
};

template <typename T> struct cbor_range_decoder {
    template <IsSequence R> expected<void> decode(R &value) {
        auto &self = detail::underlying<T>(this);
        auto  len  = self.array();
        if (!len) {
            return unexpected<decode_error>(len.error());
        }

        value.clear();
        if constexpr (HasReserve<R>) {
            if (len->is_definite()) {
                value.reserve(detail::reservation<typename R::value_type>(len->value));
            }
        }

        return self.items_with(*len, [&value](auto &dec) -> expected<void> {
            typename R::value_type item{};
            if (auto ok = dec.decode(item); !ok) {
                return ok;
            }
            value.push_back(std::move(item));
            return {};
        });
    }

    // Duplicate keys are not an error, the last one wins
    template <IsMap M> expected<void> decode(M &value) {
        auto &self = detail::underlying<T>(this);
        auto  len  = self.map();
        if (!len) {
            return unexpected<decode_error>(len.error());
        }

        value.clear();
        return self.items_with(*len, [&value](auto &dec) -> expected<void> {
            typename M::key_type    key{};
            typename M::mapped_type mapped{};
            if (auto ok = dec.decode(key); !ok) {
                return ok;
            }
            if (auto ok = dec.decode(mapped); !ok) {
                return ok;
            }
            value.insert_or_assign(std::move(key), std::move(mapped));
            return {};
        });
    }

    // Tag 258 followed by an array
    template <IsSet S> expected<void> decode(S &value) {
        auto &self = detail::underlying<T>(this);
        if (auto ok = self.set_tag(); !ok) {
            return ok;
        }
        auto len = self.array();
        if (!len) {
            return unexpected<decode_error>(len.error());
        }

        value.clear();
        return self.items_with(*len, [&value](auto &dec) -> expected<void> {
            typename S::value_type item{};
            if (auto ok = dec.decode(item); !ok) {
                return ok;
            }
            value.insert(std::move(item));
            return {};
        });
    }
};

// Zero or one element array
template <typename T> struct cbor_optional_decoder {
    template <typename U> expected<void> decode(std::optional<U> &value) {
        auto &self = detail::underlying<T>(this);
        auto  len  = self.array();
        if (!len) {
            return unexpected<decode_error>(len.error());
        }

        if (*len == definite_length(0)) {
            value.reset();
            return {};
        }
        if (*len == definite_length(1)) {
            U inner{};
            if (auto ok = self.decode(inner); !ok) {
                return ok;
            }
            value = std::move(inner);
            return {};
        }
        return unexpected<decode_error>(decode_error::wrong_length(1, *len, "optional"));
    }
};

template <typename T> struct cbor_fixed_array_decoder {
    template <typename E, std::size_t N> expected<void> decode(std::array<E, N> &value) {
        auto &self = detail::underlying<T>(this);
        auto  len  = self.array();
        if (!len) {
            return unexpected<decode_error>(len.error());
        }
        if (*len != definite_length(N)) {
            return unexpected<decode_error>(decode_error::wrong_length(N, *len, "static array"));
        }
        for (auto &element : value) {
            if (auto ok = self.decode(element); !ok) {
                return ok;
            }
        }
        return {};
    }
};

template <typename T> struct cbor_class_decoder {
    template <typename C>
        requires(IsClassWithDecodingOverload<T, C>)
    expected<void> decode(C &value) {
        auto          &self            = detail::underlying<T>(this);
        constexpr bool has_decode      = HasDecodeMethod<T, C>;
        constexpr bool has_free_decode = HasDecodeFreeFunction<T, C>;

        static_assert(has_decode ^ has_free_decode,
                      "Class must have either a decode(Decoder&) method or a free decode(Decoder&, Class&) function, not both. "
                      "Give friend access if the method is private, i.e friend cbor::stream::Access");

        if constexpr (has_decode) {
            auto result = Access::decode(self, value);
            if (!result) {
                return unexpected<decode_error>(result.error());
            }
        } else {
            auto result = detail::adl_indirect_decode(self, value);
            if (!result) {
                return unexpected<decode_error>(result.error());
            }
        }
        return {};
    }
};

template <ByteSource Source, IsOptions Options = default_options>
using default_decoder = decoder<Source, Options, cbor_header_decoder, cbor_integer_decoder, cbor_simple_decoder, cbor_string_decoder,
                                cbor_range_decoder, cbor_optional_decoder, cbor_fixed_array_decoder, cbor_class_decoder>;

// Borrows the bytes, they must outlive the decoder
template <IsOptions Options = default_options> inline auto make_decoder(std::span<const std::byte> data) {
    return default_decoder<span_source, Options>(span_source{data});
}

template <IsOptions Options = default_options> inline auto make_decoder(std::vector<std::byte> &&data) {
    return default_decoder<vector_source, Options>(vector_source{std::move(data)});
}

template <IsOptions Options = default_options>
inline auto make_decoder(std::istream &in, std::size_t capacity = CBOR_STREAM_DEFAULT_BUFFER_SIZE) {
    return default_decoder<istream_source, Options>(istream_source{in, capacity});
}

template <IsOptions Options = default_options, ByteSource Source> inline auto make_decoder(Source source) {
    return default_decoder<Source, Options>(std::move(source));
}

} // namespace cbor::stream
