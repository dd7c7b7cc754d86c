#include <catch2/catch.hpp>

#include "formats/payload_expander.h"
#include "replay_decoder.hpp"
#include "replay_fixture.hpp"

using namespace replay;
using namespace test_replay;

namespace {

// Données peu compressibles : un octet nul sur dix, le reste pseudo-aléatoire.
std::vector<std::byte> noisy_body(size_t size) {
    std::vector<std::byte> out(size);
    uint32_t state = 0x12345678;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1664525u + 1013904223u;
        out[i] = (i % 10 == 0) ? std::byte{0} : std::byte{static_cast<uint8_t>(state >> 24)};
    }
    return out;
}

std::vector<std::byte> deflate_raw(const std::vector<std::byte> &data) {
    z_stream zs{};
    REQUIRE(deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8,
                         Z_DEFAULT_STRATEGY) == Z_OK);
    std::vector<std::byte> out(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef *>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    REQUIRE(deflate(&zs, Z_FINISH) == Z_STREAM_END);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

} // namespace

TEST_CASE("zlib header check follows the deflate method rules") {
    CHECK(is_zlib_header(0x78, 0x9C));
    CHECK(is_zlib_header(0x78, 0x01));
    CHECK(is_zlib_header(0x78, 0xDA));
    CHECK_FALSE(is_zlib_header(0x78, 0x00));
    CHECK_FALSE(is_zlib_header(0x79, 0x9C));
    CHECK_FALSE(is_zlib_header(0xFF, 0xFF));
}

TEST_CASE("inflate attempts are tried in a fixed order") {
    auto attempts = inflate_attempts();
    REQUIRE(attempts.size() == 5);
    CHECK(attempts[0].window_bits == 15);
    CHECK(attempts[0].skip == 0);
    CHECK(attempts[3].skip == 2);
    CHECK(attempts[3].window_bits == -15);
    CHECK(attempts[4].skip == 0);
    CHECK(attempts[4].window_bits == -15);
}

TEST_CASE("game data plausibility rejects uniform buffers") {
    CHECK_FALSE(looks_like_game_data(std::vector<std::byte>(100, std::byte{0})));
    CHECK_FALSE(looks_like_game_data(std::vector<std::byte>(100, std::byte{'A'})));
    CHECK_FALSE(looks_like_game_data(noisy_body(32)));
    CHECK(looks_like_game_data(noisy_body(1000)));
    CHECK(looks_like_game_data(two_player_body()));
}

TEST_CASE("inflate_stream honours the output cap and reports errors") {
    auto data = noisy_body(5000);
    auto packed = deflate_zlib(data);

    bool truncated = true;
    auto full = inflate_stream(packed, 15, kMaxInflatedSize, truncated);
    REQUIRE(full.has_value());
    CHECK(*full == data);
    CHECK_FALSE(truncated);

    auto capped = inflate_stream(packed, 15, 100, truncated);
    REQUIRE(capped.has_value());
    CHECK(capped->size() == 100);
    CHECK(truncated);

    auto garbage = bytes_of({0xFF, 0xFF, 0xFF, 0xFF});
    CHECK_FALSE(inflate_stream(garbage, 15, kMaxInflatedSize, truncated).has_value());
}

TEST_CASE("Remastered body is inflated from the prolog stream") {
    auto body = two_player_body();
    auto file = make_remastered_file(body);
    auto expansion = expand_payload(file, FormatRevision::Remastered, quiet_options());
    CHECK(expansion.mode == PayloadMode::Inflated);
    CHECK(expansion.body == body);
    REQUIRE(expansion.stream_offset.has_value());
    CHECK(*expansion.stream_offset == kPrologSize);
    CHECK(expansion.attempt == "zlib/15");
    CHECK_FALSE(expansion.truncated_stream);
    CHECK(expansion.issues.empty());
}

TEST_CASE("Raw deflate after a zlib header is found by a later attempt") {
    auto body = noisy_body(2000);
    auto file = prolog(kRemasteredSignature);
    append(file, {0x78, 0x9C});
    auto packed = deflate_raw(body);
    file.insert(file.end(), packed.begin(), packed.end());
    append(file, {0xDE, 0xAD, 0xBE, 0xEF});

    auto expansion = expand_payload(file, FormatRevision::Remastered, quiet_options());
    CHECK(expansion.mode == PayloadMode::Inflated);
    CHECK(expansion.attempt == "deflate-brut/+2");
    CHECK(expansion.body == body);
    CHECK_FALSE(expansion.issues.empty());
}

TEST_CASE("Truncated compressed stream keeps the partial output") {
    auto body = noisy_body(8000);
    auto file = make_remastered_file(body);
    file.resize(kPrologSize + (file.size() - kPrologSize) / 2);

    auto expansion = expand_payload(file, FormatRevision::Remastered, quiet_options());
    REQUIRE(expansion.mode == PayloadMode::Inflated);
    CHECK(expansion.truncated_stream);
    CHECK(expansion.body.size() < body.size());
    CHECK(std::equal(expansion.body.begin(), expansion.body.end(), body.begin()));
    CHECK_FALSE(expansion.issues.empty());
}

TEST_CASE("Undecodable stream falls back to the raw bytes") {
    auto file = prolog(kRemasteredSignature);
    append(file, {0x78, 0x9C});
    file.insert(file.end(), 300, std::byte{0xFF});

    auto expansion = expand_payload(file, FormatRevision::Remastered, quiet_options());
    CHECK(expansion.mode == PayloadMode::RawFallback);
    CHECK(expansion.body.size() == 302);
    CHECK_FALSE(expansion.stream_offset.has_value());

    DecodeResult result;
    REQUIRE_NOTHROW(result = decode_replay(file, quiet_options()));
    CHECK(result.stats.payload == PayloadMode::RawFallback);
    CHECK(result.header.signature == "seRS");
    CHECK(result.stats.roster_tier == ResolveTier::Placeholder);
    REQUIRE(result.players.size() == 2);
    CHECK(result.players[0].name == "Player 1");
    CHECK(result.stats.reliability == Reliability::Low);
}

TEST_CASE("Bodies without a compressed stream are read as-is") {
    auto body = std::vector<std::byte>(200, std::byte{0x11});
    auto remastered = make_file(kRemasteredSignature, body);
    auto expansion = expand_payload(remastered, FormatRevision::Remastered, quiet_options());
    CHECK(expansion.mode == PayloadMode::Uncompressed);
    CHECK(expansion.body == body);
    CHECK_FALSE(expansion.issues.empty());

    auto legacy = make_file(kLegacySignature, body);
    expansion = expand_payload(legacy, FormatRevision::Legacy, quiet_options());
    CHECK(expansion.mode == PayloadMode::Uncompressed);
    CHECK(expansion.body == body);
    CHECK(expansion.issues.empty());
}
