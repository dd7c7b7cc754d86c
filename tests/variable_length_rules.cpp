#include <catch2/catch.hpp>

#include "core/command_stream.h"
#include "replay_fixture.hpp"

using namespace replay;
using namespace test_replay;

namespace {

CommandStreamResult decode_with(VariableLengthRule rule, size_t cap,
                                const std::vector<std::byte> &section) {
    auto opt = quiet_options();
    opt.variable_length_rule = rule;
    opt.max_variable_length = cap;
    return CommandStreamDecoder(opt).decode(section);
}

std::string chat_text(const Command &cmd) {
    REQUIRE(std::holds_alternative<ChatParams>(cmd.params));
    return std::get<ChatParams>(cmd.params).text;
}

} // namespace

TEST_CASE("Null-terminated chat stops at the terminator") {
    std::vector<std::byte> section;
    append_command(section, kOpcodeChat, 0, {'g', 'g', 0x00});
    append_command(section, 0x10, 0, {0x00});

    auto result = decode_with(VariableLengthRule::NullTerminated, 80, section);
    REQUIRE(result.commands.size() == 2);
    CHECK(chat_text(result.commands[0]) == "gg");
    CHECK(result.commands[0].raw == std::vector<uint8_t>{'g', 'g'});
    CHECK_FALSE(result.commands[0].effective);
    CHECK(result.commands[1].opcode == 0x10);
}

TEST_CASE("Null-terminated chat is capped and consumes a terminator at the cap") {
    std::vector<std::byte> section;
    append_command(section, kOpcodeChat, 0, {'a', 'b', 'c', 'd', 0x00});
    append_command(section, 0x10, 1, {0x00});

    auto result = decode_with(VariableLengthRule::NullTerminated, 4, section);
    REQUIRE(result.commands.size() == 2);
    CHECK(chat_text(result.commands[0]) == "abcd");
    CHECK(result.commands[1].player == 1);
    CHECK(result.unknown_opcodes == 0);
}

TEST_CASE("Null-terminated chat without terminator is an underrun") {
    std::vector<std::byte> section;
    append_command(section, kOpcodeChat, 0, {'a', 'b'});
    auto result = decode_with(VariableLengthRule::NullTerminated, 80, section);
    CHECK(result.commands.empty());
    CHECK(result.ended_by_underrun);
}

TEST_CASE("Length-prefixed chat reads the declared length") {
    std::vector<std::byte> section;
    append_command(section, kOpcodeChat, 0, {0x03, 'x', 'y', 'z'});
    append_command(section, 0x10, 0, {0x00});

    auto result = decode_with(VariableLengthRule::LengthPrefixed, 80, section);
    REQUIRE(result.commands.size() == 2);
    CHECK(chat_text(result.commands[0]) == "xyz");

    // Le texte est tronqué mais toute la longueur déclarée est consommée
    result = decode_with(VariableLengthRule::LengthPrefixed, 2, section);
    REQUIRE(result.commands.size() == 2);
    CHECK(chat_text(result.commands[0]) == "xy");
    CHECK(result.commands[0].raw.size() == 2);
    CHECK(result.commands[1].opcode == 0x10);

    auto shortData = bytes_of({kOpcodeChat, 0x00, 0x05, 'a'});
    result = decode_with(VariableLengthRule::LengthPrefixed, 80, shortData);
    CHECK(result.commands.empty());
    CHECK(result.ended_by_underrun);
}

TEST_CASE("Fixed-cap chat reads exactly the cap") {
    std::vector<std::byte> section;
    append_command(section, kOpcodeChat, 0, {'a', 0x00, 'c'});
    append_command(section, 0x10, 0, {0x00});

    auto result = decode_with(VariableLengthRule::FixedCap, 3, section);
    REQUIRE(result.commands.size() == 2);
    CHECK(chat_text(result.commands[0]) == "a");
    CHECK(result.commands[0].raw.size() == 3);
    CHECK(result.commands[1].opcode == 0x10);
}
