#include <catch2/catch.hpp>

#include "analysis/analytics_engine.h"
#include "replay_fixture.hpp"

using namespace replay;

namespace {

Command raw_command(uint32_t frame, uint8_t opcode, std::vector<uint8_t> raw,
                    CommandParams params = std::monostate{}) {
    Command cmd;
    cmd.frame = frame;
    cmd.opcode = opcode;
    cmd.raw = std::move(raw);
    cmd.params = std::move(params);
    cmd.effective = true;
    return cmd;
}

} // namespace

TEST_CASE("Numeric identifiers are extracted from action names") {
    CHECK(entity_id_from_name("Train7") == uint16_t{7});
    CHECK(entity_id_from_name("Build 109") == uint16_t{109});
    CHECK(entity_id_from_name("research #5") == uint16_t{5});
    CHECK(entity_id_from_name("UPGRADE 12") == uint16_t{12});
    CHECK_FALSE(entity_id_from_name("Train").has_value());
    CHECK_FALSE(entity_id_from_name("Stop 5").has_value());
    CHECK_FALSE(entity_id_from_name("Train 99999").has_value());
}

TEST_CASE("Direct parameters give full confidence") {
    auto desc = *lookup_opcode(0x1F);
    auto cmd = raw_command(0, 0x1F, {0x07, 0x00}, EntityParams{7});
    auto r = resolve_entity(cmd, desc, Race::Terran);
    REQUIRE(r.has_value());
    CHECK(r->entity.name == "SCV");
    CHECK(r->confidence == kConfidenceDirect);
    CHECK_FALSE(r->inferred);

    auto research = raw_command(0, 0x2F, {0x13}, EntityParams{19});
    r = resolve_entity(research, *lookup_opcode(0x2F), Race::Protoss);
    REQUIRE(r.has_value());
    CHECK(r->entity.name == "Psionic Storm");
}

TEST_CASE("Identifier embedded in the action name") {
    OpcodeDescriptor desc{0x1F, "Train 7", 2, true, ActionKind::Train, ParamLayout::Raw};
    auto r = resolve_entity(raw_command(0, 0x1F, {}), desc, Race::Terran);
    REQUIRE(r.has_value());
    CHECK(r->entity.name == "SCV");
    CHECK(r->confidence == kConfidenceNamePattern);
    CHECK_FALSE(r->inferred);
}

TEST_CASE("Parameter scan keeps entities of the player's race") {
    OpcodeDescriptor desc{0x0C, "Build", 6, true, ActionKind::Build, ParamLayout::Raw};
    auto r = resolve_entity(raw_command(0, 0x0C, {0xFF, 0x6D, 0x00}), desc, Race::Terran);
    REQUIRE(r.has_value());
    CHECK(r->entity.name == "Supply Depot");
    CHECK(r->confidence == kConfidenceSiblingScan);

    // Spawning Pool n'est pas une entité terran : déduction par phase
    r = resolve_entity(raw_command(0, 0x0C, {0x8E, 0xFF}), desc, Race::Terran);
    REQUIRE(r.has_value());
    CHECK(r->confidence == kConfidenceInferred);
    CHECK(r->inferred);
    CHECK(r->entity.name == "Supply Depot");
}

TEST_CASE("Race and phase inference is the last resort") {
    auto build = *lookup_opcode(0x0C);
    auto early = resolve_entity(raw_command(24 * 120, 0x0C, {}), build, Race::Protoss);
    REQUIRE(early.has_value());
    CHECK(early->entity.name == "Gateway");
    CHECK(early->confidence == kConfidenceInferred);
    CHECK(early->inferred);

    auto morph = *lookup_opcode(0x21);
    auto lurker = resolve_entity(raw_command(24 * 400, 0x21, {}), morph, Race::Zerg);
    REQUIRE(lurker.has_value());
    CHECK(lurker->entity.name == "Lurker");

    CHECK_FALSE(resolve_entity(raw_command(0, 0x0C, {}), build, Race::Random).has_value());
    CHECK_FALSE(resolve_entity(raw_command(0, 0x10, {}), *lookup_opcode(0x10), Race::Terran)
                    .has_value());
}

TEST_CASE("Low-confidence entries are tagged in the build order") {
    PlayerRecord player{0, "Alice", Race::Terran, 1, 0, ParticipantKind::Human};
    std::vector<Command> commands{
        raw_command(10, 0x1F, {0x07, 0x00}, EntityParams{7}),
        raw_command(24 * 90, 0x0C, {}),
    };
    AnalyticsEngine engine(test_replay::quiet_options());
    auto summary = engine.analyze_player(player, 24 * 600, commands);

    REQUIRE(summary.build_order.size() == 2);
    const auto &direct = summary.build_order[0];
    CHECK(direct.confidence == 100);
    CHECK(direct.note == "Opening");
    CHECK_FALSE(direct.inferred);

    const auto &guessed = summary.build_order[1];
    CHECK(guessed.entity_name == "Barracks");
    CHECK(guessed.confidence < kConfidentThreshold);
    CHECK(guessed.inferred);
    CHECK(guessed.note == "Early game (inferred from race and phase)");
    CHECK(guessed.time == "1:30");
}

TEST_CASE("Random race players get no guessed entries") {
    PlayerRecord player{0, "Rand", Race::Random, 1, 0, ParticipantKind::Human};
    std::vector<Command> commands{raw_command(10, 0x0C, {}), raw_command(20, 0x1F, {})};
    AnalyticsEngine engine(test_replay::quiet_options());
    auto summary = engine.analyze_player(player, 24 * 60, commands);
    CHECK(summary.build_order.empty());
    CHECK(summary.supply_history.size() == 1);
    CHECK(summary.command_count == 2);
}
