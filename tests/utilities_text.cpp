#include <catch2/catch.hpp>

#include "replay_fixture.hpp"
#include "utilities.hpp"

using namespace replay;
using test_replay::bytes_of;

TEST_CASE("frames_to_time formats minutes and seconds") {
    CHECK(frames_to_time(0, kFramesPerSecond) == "0:00");
    CHECK(frames_to_time(23, kFramesPerSecond) == "0:00");
    CHECK(frames_to_time(24, kFramesPerSecond) == "0:01");
    CHECK(frames_to_time(24 * 75, kFramesPerSecond) == "1:15");
    CHECK(frames_to_time(24 * 3600, kFramesPerSecond) == "60:00");
    CHECK(frames_to_time(100, 0.0) == "0:00");
}

TEST_CASE("hex_byte prints two lowercase digits") {
    CHECK(hex_byte(0x00) == "0x00");
    CHECK(hex_byte(0x1F) == "0x1f");
    CHECK(hex_byte(0xFF) == "0xff");
}

TEST_CASE("is_valid_utf8 accepts well-formed sequences only") {
    CHECK(is_valid_utf8(bytes_of({'a', 'b'})));
    CHECK(is_valid_utf8(bytes_of({0xC3, 0xA9})));
    CHECK(is_valid_utf8(bytes_of({0xE2, 0x82, 0xAC})));
    CHECK(is_valid_utf8(bytes_of({0xF0, 0x9F, 0x98, 0x80})));
    CHECK_FALSE(is_valid_utf8(bytes_of({0xC3})));
    CHECK_FALSE(is_valid_utf8(bytes_of({0xE9, 'a'})));
    CHECK_FALSE(is_valid_utf8(bytes_of({0xE2, 0x82})));
    CHECK_FALSE(is_valid_utf8(bytes_of({0x80})));
}

TEST_CASE("utf8_length counts code points") {
    CHECK(utf8_length("") == 0);
    CHECK(utf8_length("Bob") == 3);
    CHECK(utf8_length("Jos\xC3\xA9") == 4);
}

TEST_CASE("quiet logging produces no exception") {
    DecoderOptions opt;
    opt.quiet = true;
    REQUIRE_NOTHROW(log_info("test", "message", opt));
    REQUIRE_NOTHROW(log_warn("test", "message", opt));
    REQUIRE_NOTHROW(log_error("test", "message", opt));
}
