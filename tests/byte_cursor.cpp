#include <catch2/catch.hpp>

#include "core/byte_cursor.h"
#include "replay_fixture.hpp"

using namespace replay;
using test_replay::bytes_of;

TEST_CASE("ByteCursor reads little-endian integers") {
    auto data = bytes_of({0x7F, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12});
    ByteCursor cursor(data);
    CHECK(cursor.readU8() == uint8_t{0x7F});
    CHECK(cursor.readU16LE() == uint16_t{0x1234});
    CHECK(cursor.readU32LE() == uint32_t{0x12345678});
    CHECK(cursor.atEnd());
    CHECK_FALSE(cursor.underrun());
}

TEST_CASE("ByteCursor reports underrun without moving") {
    auto data = bytes_of({0x01, 0x02, 0x03});
    ByteCursor cursor(data);
    cursor.seek(1);
    CHECK_FALSE(cursor.readU32LE().has_value());
    CHECK(cursor.underrun());
    CHECK(cursor.position() == 1);
    CHECK_FALSE(cursor.readBytes(3).has_value());
    auto two = cursor.readBytes(2);
    REQUIRE(two.has_value());
    CHECK(*two == std::vector<uint8_t>{0x02, 0x03});
    CHECK_FALSE(cursor.readU8().has_value());
    CHECK_FALSE(cursor.peekU8().has_value());
}

TEST_CASE("ByteCursor seek is clamped and skip stops at end") {
    auto data = bytes_of({0xAA, 0xBB, 0xCC, 0xDD});
    ByteCursor cursor(data);
    cursor.seek(100);
    CHECK(cursor.position() == 4);
    CHECK(cursor.remaining() == 0);

    cursor.seek(1);
    CHECK(cursor.peekU8() == uint8_t{0xBB});
    CHECK(cursor.position() == 1);
    CHECK(cursor.skip(2));
    CHECK(cursor.readU8() == uint8_t{0xDD});

    cursor.seek(2);
    CHECK_FALSE(cursor.skip(5));
    CHECK(cursor.atEnd());
    CHECK(cursor.underrun());
}

TEST_CASE("ByteCursor fixed strings stop at the first zero") {
    std::vector<std::byte> data;
    test_replay::put_text(data, 0, "Alice");
    data.resize(8);
    test_replay::put_u8(data, 6, 'x');
    ByteCursor cursor(data);
    auto name = cursor.readFixedString(8);
    REQUIRE(name.has_value());
    CHECK(*name == "Alice");
    CHECK(cursor.atEnd());
}

TEST_CASE("decode_text keeps valid UTF-8 and filters invalid bytes") {
    std::string utf8 = "Jos\xC3\xA9\x01";
    std::vector<std::byte> field;
    test_replay::put_text(field, 0, utf8);
    CHECK(decode_text(field) == "Jos\xC3\xA9");

    auto latin = bytes_of({'A', 0xE9, 'b', 0x7F, 'c'});
    CHECK(decode_text(latin) == "Abc");

    CHECK(decode_text({}).empty());
}
