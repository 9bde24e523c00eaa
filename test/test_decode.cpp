#include "cbor_stream/cbor_decoder.h"
#include "test_util.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <doctest/doctest.h>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace cbor::stream;

namespace geo {

struct point {
    std::int64_t x{};
    std::int64_t y{};

    bool operator==(const point &) const = default;

  private:
    friend cbor::stream::Access;
    template <typename Decoder> cbor::stream::expected<void> decode(Decoder &dec) { return dec(as_tuple{2, "point"}, x, y); }
};

struct segment {
    point       from;
    point       to;
    std::string label;
};

template <typename Decoder> cbor::stream::expected<void> decode(Decoder &dec, segment &s) {
    return dec(as_tuple{3, "segment"}, s.from, s.to, s.label);
}

} // namespace geo

TEST_SUITE("optional") {
    TEST_CASE("absent and present") {
        auto data = to_bytes("808105");
        auto dec  = make_decoder(data);

        std::optional<int> absent{7};
        std::optional<int> present;
        REQUIRE(dec(absent, present));
        CHECK_FALSE(absent.has_value());
        REQUIRE(present.has_value());
        CHECK_EQ(*present, 5);
    }

    TEST_CASE_TEMPLATE("any other length is rejected", T, int, bool, std::string, std::vector<int>) {
        {
            auto data  = to_bytes("820102");
            auto dec   = make_decoder(data);
            auto value = dec.decode<std::optional<T>>();
            REQUIRE_FALSE(value);
            CHECK_EQ(value.error(), decode_error::wrong_length(1, definite_length(2), "optional"));
        }
        {
            auto data  = to_bytes("9f01ff");
            auto dec   = make_decoder(data);
            auto value = dec.decode<std::optional<T>>();
            REQUIRE_FALSE(value);
            CHECK_EQ(value.error(), decode_error::wrong_length(1, indefinite_length, "optional"));
        }
    }

    TEST_CASE("error of the element propagates") {
        auto data = to_bytes("8101");
        auto dec  = make_decoder(data);

        auto value = dec.decode<std::optional<std::string>>();
        REQUIRE_FALSE(value);
        CHECK_EQ(value.error(), decode_error::type_mismatch(major_type::TextString, major_type::UnsignedInteger));
    }
}

TEST_SUITE("fixed size arrays") {
    TEST_CASE("bytes") {
        auto data = to_bytes("84010218ff03");
        auto dec  = make_decoder(data);

        auto value = dec.decode_complete<std::array<std::byte, 4>>();
        REQUIRE(value);
        CHECK_EQ(to_hex(*value), "0102ff03");
    }

    TEST_CASE("length must match") {
        auto data = to_bytes("83010203");
        auto dec  = make_decoder(data);

        auto value = dec.decode<std::array<std::byte, 4>>();
        REQUIRE_FALSE(value);
        CHECK_EQ(value.error(), decode_error::wrong_length(4, definite_length(3), "static array"));
    }

    TEST_CASE("indefinite is rejected") {
        auto data = to_bytes("9f01020304ff");
        auto dec  = make_decoder(data);

        auto value = dec.decode<std::array<std::byte, 4>>();
        REQUIRE_FALSE(value);
        CHECK_EQ(value.error(), decode_error::wrong_length(4, indefinite_length, "static array"));
    }

    TEST_CASE("element out of byte range") {
        auto data = to_bytes("82011901ff");
        auto dec  = make_decoder(data);

        auto value = dec.decode<std::array<std::byte, 2>>();
        REQUIRE_FALSE(value);
        CHECK_EQ(value.error(), decode_error::integer_overflow(8, 0x1ff));
    }

    TEST_CASE("other element types") {
        auto data = to_bytes("8263666f6f63626172");
        auto dec  = make_decoder(data);

        auto value = dec.decode<std::array<std::string, 2>>();
        REQUIRE(value);
        CHECK_EQ((*value)[0], "foo");
        CHECK_EQ((*value)[1], "bar");
    }
}

TEST_SUITE("sets") {
    TEST_CASE("tagged array collapses duplicates") {
        auto data = to_bytes("d901028403010301");
        auto dec  = make_decoder(data);

        auto value = dec.decode_complete<std::set<int>>();
        REQUIRE(value);
        CHECK_EQ(*value, std::set<int>{1, 3});
    }

    TEST_CASE("untagged array is rejected") {
        auto data = to_bytes("8101");
        auto dec  = make_decoder(data);

        auto value = dec.decode<std::set<int>>();
        REQUIRE_FALSE(value);
        CHECK_EQ(value.error(), decode_error::type_mismatch(major_type::Tag, major_type::Array));
    }

    TEST_CASE("other tag is rejected") {
        auto data = to_bytes("d9010380");
        auto dec  = make_decoder(data);

        auto value = dec.decode<std::set<int>>();
        REQUIRE_FALSE(value);
        CHECK_EQ(value.error(), decode_error::expected_set_tag(259));
    }
}

TEST_SUITE("composition") {
    TEST_CASE("variadic call decodes in order") {
        auto data = to_bytes("0a6568656c6c6ff5");
        auto dec  = make_decoder(data);

        std::uint16_t number{};
        std::string   word;
        bool          flag{};
        REQUIRE(dec(number, word, flag));
        CHECK_EQ(number, 10);
        CHECK_EQ(word, "hello");
        CHECK(flag);
    }

    TEST_CASE("variadic call stops at the first error") {
        auto data = to_bytes("0a0b0c");
        auto dec  = make_decoder(data);

        int         a{};
        std::string b{"unchanged"};
        int         c{-1};
        auto        result = dec(a, b, c);
        REQUIRE_FALSE(result);
        CHECK_EQ(result.error(), decode_error::type_mismatch(major_type::TextString, major_type::UnsignedInteger));
        CHECK_EQ(a, 10);
        CHECK_EQ(b, "unchanged");
        CHECK_EQ(c, -1);
    }

    TEST_CASE("record with a decode method") {
        auto data = to_bytes("82182a3863");
        auto dec  = make_decoder(data);

        auto value = dec.decode_complete<geo::point>();
        REQUIRE(value);
        CHECK(*value == geo::point{42, -100});
    }

    TEST_CASE("record with a free decode function") {
        // [[1, 2], [-3, 4], "a to b"]
        auto data = to_bytes("83820102822204666120746f2062");
        auto dec  = make_decoder(data);

        auto value = dec.decode_complete<geo::segment>();
        REQUIRE(value);
        CHECK_EQ(value->from.x, 1);
        CHECK_EQ(value->from.y, 2);
        CHECK_EQ(value->to.x, -3);
        CHECK_EQ(value->to.y, 4);
        CHECK_EQ(value->label, "a to b");
    }

    TEST_CASE("record arity is checked") {
        auto data = to_bytes("83010203");
        auto dec  = make_decoder(data);

        auto value = dec.decode<geo::point>();
        REQUIRE_FALSE(value);
        CHECK_EQ(value.error(), decode_error::wrong_length(2, definite_length(3), "point"));
    }

    TEST_CASE("nested containers") {
        // {"odd": [1, 3], "even": [_ 2, 4]}
        auto data = to_bytes("a2636f6464820103646576656e9f0204ff");
        auto dec  = make_decoder(data);

        auto value = dec.decode_complete<std::map<std::string, std::vector<int>>>();
        REQUIRE(value);
        CHECK_EQ(value->at("odd"), std::vector<int>{1, 3});
        CHECK_EQ(value->at("even"), std::vector<int>{2, 4});
    }

    TEST_CASE("vector of records") {
        auto data = to_bytes("9f820102820304ff");
        auto dec  = make_decoder(data);

        auto value = dec.decode_complete<std::vector<geo::point>>();
        REQUIRE(value);
        REQUIRE_EQ(value->size(), 2);
        CHECK_EQ((*value)[1].x, 3);
        CHECK_EQ((*value)[1].y, 4);
    }
}

TEST_SUITE("entry points") {
    TEST_CASE("decode leaves trailing bytes") {
        auto data = to_bytes("0102");
        auto dec  = make_decoder(data);

        auto first = dec.decode<int>();
        REQUIRE(first);
        CHECK_EQ(*first, 1);

        auto second = dec.decode_complete<int>();
        REQUIRE(second);
        CHECK_EQ(*second, 2);
    }

    TEST_CASE("decode_complete rejects trailing bytes") {
        auto data = to_bytes("0102");
        auto dec  = make_decoder(data);

        auto value = dec.decode_complete<int>();
        REQUIRE_FALSE(value);
        CHECK_EQ(value.error(), decode_error::trailing_data());
    }

    TEST_CASE("owning decoder hands back what it did not read") {
        auto dec = make_decoder(to_bytes("0a0b0c"));

        auto value = dec.decode<int>();
        REQUIRE(value);
        CHECK_EQ(*value, 10);

        auto rest = std::move(dec).release().release();
        CHECK_EQ(to_hex(rest), "0b0c");
    }

    TEST_CASE("any byte source") {
        auto data = to_bytes("83010203");
        auto dec  = make_decoder(span_source{data});

        auto value = dec.decode_complete<std::vector<std::uint8_t>>();
        REQUIRE(value);
        CHECK_EQ(*value, std::vector<std::uint8_t>{1, 2, 3});
    }

    TEST_CASE("stream input with a record per call") {
        auto               data = to_bytes("820102820304");
        std::istringstream in(std::string(reinterpret_cast<const char *>(data.data()), data.size()));
        auto               dec = make_decoder(in);

        auto first = dec.decode<geo::point>();
        REQUIRE(first);
        CHECK_EQ(first->y, 2);

        auto second = dec.decode_complete<geo::point>();
        REQUIRE(second);
        CHECK_EQ(second->x, 3);
    }
}
