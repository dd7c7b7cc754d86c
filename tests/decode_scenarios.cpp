#include <catch2/catch.hpp>

#include "replay_decoder.hpp"
#include "replay_fixture.hpp"

using namespace replay;
using namespace test_replay;

namespace {

// Corps avec `count` commandes Stop alternées entre les deux joueurs.
std::vector<std::byte> body_with_commands(size_t count) {
    auto body = two_player_body(24 * 60 * 10);
    for (size_t i = 0; i < count; ++i) {
        append_frames(body, 4);
        append_command(body, 0x10, static_cast<uint8_t>(i % 2), {0x00});
    }
    return body;
}

} // namespace

TEST_CASE("Header-only replay decodes two players with idle analytics") {
    auto result = decode_replay(make_file(kLegacySignature, two_player_body()), quiet_options());
    CHECK(result.header.map_name == "Fighting Spirit");
    CHECK(result.header.frames == 2400);
    CHECK(result.header.revision == FormatRevision::Legacy);
    REQUIRE(result.players.size() == 2);
    CHECK(result.players[0].name == "Alice");
    CHECK(result.players[0].race == Race::Zerg);
    CHECK(result.players[1].name == "Bob");
    CHECK(result.players[1].race == Race::Terran);
    CHECK(result.commands.empty());
    REQUIRE(result.analytics.size() == 2);
    for (const auto &a : result.analytics) {
        CHECK(a.apm == 0.0);
        CHECK(a.eapm == 0.0);
        CHECK(a.build_order.empty());
        CHECK(a.supply_history.size() == 1);
    }
    CHECK(result.stats.reliability == Reliability::Low);
    CHECK(result.stats.input_bytes == kPrologSize + kHeaderSize);
    CHECK(result.stats.body_bytes == kHeaderSize);
}

TEST_CASE("Decoding is deterministic") {
    auto file = make_file(kLegacySignature, body_with_commands(50));
    auto first = decode_replay(file, quiet_options());
    auto second = decode_replay(file, quiet_options());
    CHECK(first == second);
}

TEST_CASE("Remastered and legacy containers carry the same content") {
    auto body = body_with_commands(40);
    auto legacy = decode_replay(make_file(kLegacySignature, body), quiet_options());
    auto remastered = decode_replay(make_remastered_file(body), quiet_options());
    CHECK(remastered.stats.payload == PayloadMode::Inflated);
    CHECK(remastered.header.revision == FormatRevision::Remastered);
    CHECK(remastered.header.signature == "seRS");
    CHECK(remastered.players == legacy.players);
    CHECK(remastered.commands == legacy.commands);
    CHECK(remastered.analytics == legacy.analytics);
}

TEST_CASE("Analytics match the roster and commands stay in frame order") {
    auto result = decode_replay(make_file(kLegacySignature, body_with_commands(30)),
                                quiet_options());
    REQUIRE(result.analytics.size() == result.players.size());
    for (size_t i = 0; i < result.players.size(); ++i) {
        CHECK(result.analytics[i].player == result.players[i].slot);
        CHECK(result.analytics[i].command_count == 15);
        CHECK(result.analytics[i].eapm <= result.analytics[i].apm);
    }
    for (size_t i = 1; i < result.commands.size(); ++i) {
        CHECK(result.commands[i - 1].frame <= result.commands[i].frame);
    }
    CHECK(result.stats.final_frame == 30 * 4);
}

TEST_CASE("Reliability grades") {
    auto many = decode_replay(make_file(kLegacySignature, body_with_commands(600)),
                              quiet_options());
    CHECK(many.stats.commands_decoded == 600);
    CHECK(many.stats.reliability == Reliability::High);

    auto few = decode_replay(make_file(kLegacySignature, body_with_commands(10)),
                             quiet_options());
    CHECK(few.stats.reliability == Reliability::Medium);

    auto body = body_with_commands(600);
    append(body, {0xFF});
    auto resynced = decode_replay(make_file(kLegacySignature, body), quiet_options());
    CHECK(resynced.stats.resyncs == 1);
    CHECK(resynced.stats.reliability == Reliability::Medium);
}

TEST_CASE("Reliability assessment rules") {
    ParseStatistics stats;
    stats.commands_decoded = 1000;
    CHECK(assess_reliability(stats) == Reliability::High);

    auto with = [&](auto change) {
        ParseStatistics s = stats;
        change(s);
        return assess_reliability(s);
    };
    CHECK(with([](ParseStatistics &s) { s.commands_decoded = 0; }) == Reliability::Low);
    CHECK(with([](ParseStatistics &s) { s.roster_tier = ResolveTier::Placeholder; }) ==
          Reliability::Low);
    CHECK(with([](ParseStatistics &s) {
              s.map_tier = ResolveTier::Placeholder;
              s.frame_tier = ResolveTier::Placeholder;
          }) == Reliability::Low);
    CHECK(with([](ParseStatistics &s) { s.map_tier = ResolveTier::Placeholder; }) ==
          Reliability::High);
    CHECK(with([](ParseStatistics &s) { s.frame_tier = ResolveTier::Placeholder; }) ==
          Reliability::Medium);
    CHECK(with([](ParseStatistics &s) { s.roster_tier = ResolveTier::Scan; }) ==
          Reliability::Medium);
    CHECK(with([](ParseStatistics &s) { s.map_tier = ResolveTier::Alternate; }) ==
          Reliability::Medium);
    CHECK(with([](ParseStatistics &s) { s.payload = PayloadMode::RawFallback; }) ==
          Reliability::Medium);
    CHECK(with([](ParseStatistics &s) { s.commands_dropped = 1; }) == Reliability::Medium);
    CHECK(with([](ParseStatistics &s) { s.hit_iteration_cap = true; }) == Reliability::Medium);
    CHECK(with([](ParseStatistics &s) { s.ended_by_underrun = true; }) == Reliability::Medium);
    CHECK(with([](ParseStatistics &s) { s.commands_decoded = 499; }) == Reliability::Medium);
}

TEST_CASE("Degraded decodes record their issues") {
    Layout layout;
    layout.table_offset = 0x161;
    auto body = make_body(0, "Python", {Slot{"Alice"}, Slot{"Bob", 2, 2}}, layout);
    append_command(body, 0x10, 0, {0x00});
    append_command(body, 0x10, 9, {0x00});

    auto result = decode_replay(make_file(kLegacySignature, body), quiet_options());
    CHECK(result.stats.roster_tier == ResolveTier::Alternate);
    CHECK(result.stats.frame_tier == ResolveTier::Placeholder);
    CHECK(result.stats.commands_dropped == 1);
    CHECK(result.stats.errors.size() >= 3);
    CHECK(result.stats.reliability == Reliability::Medium);
}

TEST_CASE("Missing files raise a read error") {
    REQUIRE_THROWS_AS(decode_replay_file("/nonexistent/replay.rep", quiet_options()),
                      std::runtime_error);
}
