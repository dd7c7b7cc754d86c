#include "opcode_catalog.h"

#include <algorithm>
#include <array>

namespace replay {

namespace {

using enum ParamLayout;

// Longueurs comptées après l'octet joueur.
constexpr std::array<OpcodeDescriptor, 27> kOpcodes{{
    {0x05, "Keep Alive", 0, false, ActionKind::None, Raw},
    {0x09, "Select", 3, false, ActionKind::None, Select},
    {0x0A, "Shift Select", 3, false, ActionKind::None, Select},
    {0x0B, "Shift Deselect", 3, false, ActionKind::None, Select},
    {0x0C, "Build", 6, true, ActionKind::Build, Build},
    {0x0D, "Vision", 2, false, ActionKind::None, Raw},
    {0x10, "Stop", 1, true, ActionKind::None, Raw},
    {0x11, "Attack Move", 4, true, ActionKind::None, Position},
    {0x13, "Hotkey", 2, false, ActionKind::None, Hotkey},
    {0x14, "Right Click", 6, true, ActionKind::None, PositionTarget},
    {0x15, "Targeted Order", 6, true, ActionKind::None, PositionTarget},
    {0x17, "Patrol", 4, true, ActionKind::None, Position},
    {0x1E, "Cancel Train", 2, false, ActionKind::None, Raw},
    {0x1F, "Train", 2, true, ActionKind::Train, Entity16},
    {0x21, "Unit Morph", 2, true, ActionKind::Morph, Entity16},
    {0x2A, "Hold Position", 1, true, ActionKind::None, Raw},
    {0x2B, "Burrow", 1, true, ActionKind::None, Raw},
    {0x2C, "Unburrow", 1, true, ActionKind::None, Raw},
    {0x2E, "Lift", 4, true, ActionKind::None, Position},
    {0x2F, "Research", 1, true, ActionKind::Research, Entity8},
    {0x31, "Upgrade", 1, true, ActionKind::Upgrade, Entity8},
    {0x34, "Building Morph", 2, true, ActionKind::Morph, Entity16},
    {0x35, "Stim", 0, true, ActionKind::None, Raw},
    {0x36, "Sync", 0, false, ActionKind::None, Raw},
    {0x57, "Leave Game", 1, false, ActionKind::None, Raw},
    {0x58, "Minimap Ping", 4, false, ActionKind::None, Position},
    {kOpcodeChat, "Chat", std::nullopt, false, ActionKind::None, Chat},
}};

static_assert(std::is_sorted(kOpcodes.begin(), kOpcodes.end(),
                             [](const OpcodeDescriptor &a, const OpcodeDescriptor &b) {
                                 return a.id < b.id;
                             }));

} // namespace

std::span<const OpcodeDescriptor> opcode_table() {
    return kOpcodes;
}

std::optional<OpcodeDescriptor> lookup_opcode(uint8_t id) {
    auto it = std::lower_bound(kOpcodes.begin(), kOpcodes.end(), id,
                               [](const OpcodeDescriptor &d, uint8_t key) { return d.id < key; });
    if (it == kOpcodes.end() || it->id != id) {
        return std::nullopt;
    }
    return *it;
}

bool is_frame_marker(uint8_t byte) {
    return byte <= kFrameSkip32;
}

} // namespace replay
