#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "../replay_types.hpp"

namespace replay {

// Octets de cadencement du flux de commandes (jamais des opcodes).
inline constexpr uint8_t kFrameStep = 0x00;  // +1 frame
inline constexpr uint8_t kFrameSkip8 = 0x01; // +u8 frames
inline constexpr uint8_t kFrameSkip16 = 0x02; // +u16 frames
inline constexpr uint8_t kFrameSkip32 = 0x03; // +u32 frames

inline constexpr uint8_t kOpcodeChat = 0x5C;

// Disposition des paramètres d'un enregistrement.
enum class ParamLayout : uint8_t {
    Raw,           // octets bruts uniquement
    Select,        // count u8, entityType u16
    Build,         // entityId u16, x u16, y u16
    Entity16,      // entityId u16
    Entity8,       // entityId u8
    Position,      // x u16, y u16
    PositionTarget,// x u16, y u16, targetId u16
    Hotkey,        // action u8, index u8
    Chat           // texte de longueur variable
};

struct OpcodeDescriptor {
    uint8_t id;
    std::string_view name;
    std::optional<uint8_t> parameter_length; // vide : longueur variable
    bool effective;
    ActionKind action;
    ParamLayout layout;
};

// Table complète, triée par opcode.
std::span<const OpcodeDescriptor> opcode_table();

std::optional<OpcodeDescriptor> lookup_opcode(uint8_t id);

bool is_frame_marker(uint8_t byte);

} // namespace replay
