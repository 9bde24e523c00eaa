#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace cbor::stream {

enum class major_type : std::uint8_t {
    UnsignedInteger = 0,
    NegativeInteger = 1,
    ByteString      = 2,
    TextString      = 3,
    Array           = 4,
    Map             = 5,
    Tag             = 6,
    Simple          = 7
};

// Top 3 bits of the initial byte
constexpr major_type major_type_of(std::byte initial) noexcept {
    return static_cast<major_type>(std::to_integer<std::uint8_t>(initial) >> 5);
}

template <typename T>
concept IsOptions = requires {
    typename T::is_options;
    { T::ieee754_floats } -> std::convertible_to<bool>;
};

template <typename T>
concept IsBool = std::is_same_v<T, bool>;

template <typename T>
concept IsUnsigned = std::is_unsigned_v<T> && std::is_integral_v<T> && !IsBool<T>;

template <typename T>
concept IsSigned = std::is_signed_v<T> && std::is_integral_v<T>;

template <typename T> struct is_std_array : std::false_type {};
template <typename E, std::size_t N> struct is_std_array<std::array<E, N>> : std::true_type {};

template <typename T>
concept IsFixedArray = is_std_array<std::remove_cvref_t<T>>::value;

template <typename T>
concept IsView = std::ranges::view<T>;

// Owning text containers only, a string_view would dangle after the chunks are joined
template <typename T>
concept IsTextString = !IsView<T> && requires(T t) {
    requires std::is_same_v<typename T::value_type, char>;
    { t.substr(0, 1) };
};

template <typename T>
concept IsByteString = !IsView<T> && !IsFixedArray<T> && std::ranges::range<T> &&
                       std::is_same_v<std::remove_cvref_t<std::ranges::range_value_t<T>>, std::byte> &&
                       std::constructible_from<T, std::vector<std::byte>::const_iterator, std::vector<std::byte>::const_iterator>;

template <typename T>
concept IsString = IsTextString<T> || IsByteString<T>;

template <typename T>
concept IsMap = std::ranges::range<T> && requires(T t) {
    typename T::key_type;
    typename T::mapped_type;
    requires std::same_as<typename T::value_type, std::pair<const typename T::key_type, typename T::mapped_type>>;
    { t.find(std::declval<typename T::key_type>()) } -> std::same_as<typename T::iterator>;
    { t.insert_or_assign(std::declval<typename T::key_type>(), std::declval<typename T::mapped_type>()) };
};

template <typename T>
concept IsSet = std::ranges::range<T> && !IsMap<T> && requires(T t) {
    typename T::key_type;
    requires std::same_as<typename T::key_type, typename T::value_type>;
    { t.insert(std::declval<typename T::value_type>()) };
    { t.find(std::declval<typename T::key_type>()) } -> std::same_as<typename T::iterator>;
};

template <typename T>
concept IsSequence = std::ranges::range<T> && !IsString<T> && !IsMap<T> && !IsSet<T> && !IsFixedArray<T> &&
                     requires(T t, typename T::value_type v) { t.push_back(std::move(v)); };

template <typename T>
concept HasReserve = requires(T t) {
    { t.reserve(std::declval<typename T::size_type>()) };
};

// The window only ever asks its source for a view of what is buffered and to drop a prefix of it
template <typename T>
concept ByteSource = std::movable<T> && requires(T s, std::size_t n) {
    { s.fill(n).has_value() } -> std::convertible_to<bool>;
    { *s.fill(n) } -> std::convertible_to<std::span<const std::byte>>;
    { s.consume(n) };
};

// A proxy that may call private decode members, give it friendship to keep them private
struct Access {
    template <typename Decoder, typename Class>
    static constexpr auto decode(Decoder &decoder, Class &obj) -> decltype(obj.decode(decoder)) {
        return obj.decode(decoder);
    }
};

template <typename Decoder, typename Class>
concept HasDecodeMethod = requires(Decoder &d, Class &c) {
    { Access::decode(d, c).has_value() } -> std::convertible_to<bool>;
};

template <typename Decoder, typename Class>
concept HasDecodeFreeFunction = requires(Decoder &d, Class &c) {
    { decode(d, c).has_value() } -> std::convertible_to<bool>;
};

template <typename Decoder, typename C>
concept IsClassWithDecodingOverload = std::is_class_v<C> && (HasDecodeMethod<Decoder, C> || HasDecodeFreeFunction<Decoder, C>);

template <typename T, typename... Ts> static constexpr bool contains() { return (std::is_same_v<T, Ts> || ...); }

} // namespace cbor::stream
