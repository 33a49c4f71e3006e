#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "lightbench/codec/CborItem.hpp"
#include "lightbench/core/Errors.hpp"

using namespace lightbench;

using Bytes = std::vector<uint8_t>;

namespace {

Bytes dumpInteger(int64_t v) {
    CborItem item = cborInteger(v);
    return dumpCbor(item.get());
}

}

TEST_CASE("integers use the shortest head", "[cbor]") {
    CHECK(dumpInteger(0) == Bytes{0x00});
    CHECK(dumpInteger(23) == Bytes{0x17});
    CHECK(dumpInteger(24) == Bytes{0x18, 0x18});
    CHECK(dumpInteger(1000) == Bytes{0x19, 0x03, 0xE8});
    CHECK(dumpInteger(60001) == Bytes{0x19, 0xEA, 0x61});
    CHECK(dumpInteger(100000) == Bytes{0x1A, 0x00, 0x01, 0x86, 0xA0});
    CHECK(dumpInteger(-1) == Bytes{0x20});
    CHECK(dumpInteger(-100) == Bytes{0x38, 0x63});
    CHECK(dumpInteger(-1000) == Bytes{0x39, 0x03, 0xE7});
}

TEST_CASE("map with integer keys matches RFC 8949 examples", "[cbor]") {
    // {1: 2, 3: 4}
    CborItem m = cborMap(2);
    cborMapPut(m.get(), 1, cborInteger(2));
    cborMapPut(m.get(), 3, cborInteger(4));
    CHECK(dumpCbor(m.get()) == Bytes{0xA2, 0x01, 0x02, 0x03, 0x04});

    CborItem back = loadCbor(Bytes{0xA2, 0x01, 0x02, 0x03, 0x04});
    REQUIRE(cborMapFind(back.get(), 3) != nullptr);
    CHECK(cborAsInteger(cborMapFind(back.get(), 3)) == 4);
    CHECK(cborMapFind(back.get(), 2) == nullptr);

    CHECK_THROWS_AS(cborMapPut(m.get(), 5, cborInteger(6)), LightbenchError);
}

TEST_CASE("replacing a map value keeps the key order", "[cbor]") {
    CborItem m = cborMap(2);
    cborMapPut(m.get(), 1, cborText("a"));
    cborMapPut(m.get(), 2, cborText("b"));

    CHECK(cborMapReplace(m.get(), 1, cborText("c")));
    CHECK_FALSE(cborMapReplace(m.get(), 9, cborText("z")));

    // {1: "c", 2: "b"}
    CHECK(dumpCbor(m.get()) == Bytes{0xA2, 0x01, 0x61, 'c', 0x02, 0x61, 'b'});
}

TEST_CASE("typed views reject the wrong type", "[cbor]") {
    CborItem t = cborText("x");
    CborItem n = cborInteger(-7);

    CHECK_FALSE(cborAsInteger(t.get()));
    CHECK(cborAsText(t.get()) == std::string("x"));
    CHECK(cborAsInteger(n.get()) == -7);
    CHECK_FALSE(cborAsText(n.get()));
    CHECK(cborMapFind(t.get(), 1) == nullptr);
}

TEST_CASE("indefinite lengths and tags are accepted", "[cbor]") {
    // [_ 1, 2]
    CHECK_NOTHROW(loadCbor(Bytes{0x9F, 0x01, 0x02, 0xFF}));

    // {_ 1: 7}
    CborItem m = loadCbor(Bytes{0xBF, 0x01, 0x07, 0xFF});
    CHECK(cborAsInteger(cborMapFind(m.get(), 1)) == 7);

    // (_ "ab", "c")
    CborItem t = loadCbor(Bytes{0x7F, 0x62, 'a', 'b', 0x61, 'c', 0xFF});
    CHECK(cborAsText(t.get()) == std::string("abc"));

    // 1("x")
    CHECK_NOTHROW(loadCbor(Bytes{0xC1, 0x61, 'x'}));
}

TEST_CASE("malformed input is a decode error", "[cbor]") {
    CHECK_THROWS_AS(loadCbor(Bytes{}), DecodeError);
    CHECK_THROWS_AS(loadCbor(Bytes{0x19, 0x03}), DecodeError);            // short uint16
    CHECK_THROWS_AS(loadCbor(Bytes{0x63, 0x61, 0x62}), DecodeError);      // short text
    CHECK_THROWS_AS(loadCbor(Bytes{0x01, 0x02}), DecodeError);            // trailing
    CHECK_THROWS_AS(loadCbor(Bytes{0xF9, 0x3C, 0x00}), DecodeError);      // half float
    CHECK_THROWS_AS(loadCbor(Bytes{0x1B, 0xFF, 0xFF, 0xFF, 0xFF,
                                   0xFF, 0xFF, 0xFF, 0xFF}), DecodeError); // > int64
    CHECK_THROWS_AS(loadCbor(Bytes{0x9F, 0x01}), DecodeError);            // missing break

    Bytes deep(40, 0x81);
    deep.push_back(0x00);
    CHECK_THROWS_AS(loadCbor(deep), DecodeError);
}

TEST_CASE("text strings must be valid UTF-8", "[cbor]") {
    // "ü" and "€" are fine.
    CHECK_NOTHROW(loadCbor(Bytes{0x62, 0xC3, 0xBC}));
    CHECK_NOTHROW(loadCbor(Bytes{0x63, 0xE2, 0x82, 0xAC}));

    CHECK_THROWS_AS(loadCbor(Bytes{0x62, 0xFF, 0xFE}), DecodeError);        // not UTF-8 at all
    CHECK_THROWS_AS(loadCbor(Bytes{0x62, 0xC0, 0x80}), DecodeError);        // overlong NUL
    CHECK_THROWS_AS(loadCbor(Bytes{0x63, 0xED, 0xA0, 0x80}), DecodeError);  // surrogate
    CHECK_THROWS_AS(loadCbor(Bytes{0x61, 0xC3}), DecodeError);              // cut sequence

    // The same bytes are fine as a byte string.
    CHECK_NOTHROW(loadCbor(Bytes{0x42, 0xFF, 0xFE}));

    // Bad text nested in a map value or split across chunks.
    CHECK_THROWS_AS(loadCbor(Bytes{0xA1, 0x01, 0x61, 0x80}), DecodeError);
    CHECK_THROWS_AS(loadCbor(Bytes{0x7F, 0x61, 0xC3, 0x61, 0xBC, 0xFF}), DecodeError);
}

TEST_CASE("utf-8 validator boundaries", "[cbor]") {
    auto valid = [](Bytes b) { return validUtf8(b.data(), b.size()); };

    CHECK(valid({}));
    CHECK(valid({'c', 'a', 'r'}));
    CHECK(valid({0xF4, 0x8F, 0xBF, 0xBF}));        // U+10FFFF
    CHECK_FALSE(valid({0xF4, 0x90, 0x80, 0x80}));  // U+110000
    CHECK_FALSE(valid({0xE0, 0x80, 0xAF}));        // overlong '/'
    CHECK_FALSE(valid({0x80}));                    // stray continuation
}
