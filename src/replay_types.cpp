#include "replay_types.hpp"

namespace replay {

const char *to_string(Race race) {
    switch (race) {
    case Race::Zerg: return "Zerg";
    case Race::Terran: return "Terran";
    case Race::Protoss: return "Protoss";
    case Race::Random: return "Random";
    }
    return "Random";
}

const char *to_string(ParticipantKind kind) {
    switch (kind) {
    case ParticipantKind::Empty: return "empty";
    case ParticipantKind::Computer: return "computer";
    case ParticipantKind::Human: return "human";
    }
    return "empty";
}

const char *to_string(ResolveTier tier) {
    switch (tier) {
    case ResolveTier::Primary: return "primary";
    case ResolveTier::Alternate: return "alternate";
    case ResolveTier::Scan: return "scan";
    case ResolveTier::Placeholder: return "placeholder";
    }
    return "placeholder";
}

const char *to_string(PayloadMode mode) {
    switch (mode) {
    case PayloadMode::Uncompressed: return "uncompressed";
    case PayloadMode::Inflated: return "inflated";
    case PayloadMode::RawFallback: return "raw-fallback";
    }
    return "raw-fallback";
}

const char *to_string(Reliability reliability) {
    switch (reliability) {
    case Reliability::High: return "high";
    case Reliability::Medium: return "medium";
    case Reliability::Low: return "low";
    }
    return "low";
}

const char *to_string(ActionKind kind) {
    switch (kind) {
    case ActionKind::None: return "None";
    case ActionKind::Build: return "Build";
    case ActionKind::Train: return "Train";
    case ActionKind::Morph: return "Morph";
    case ActionKind::Research: return "Research";
    case ActionKind::Upgrade: return "Upgrade";
    }
    return "None";
}

const char *to_string(EntityCategory category) {
    switch (category) {
    case EntityCategory::Economy: return "economy";
    case EntityCategory::Military: return "military";
    case EntityCategory::Tech: return "tech";
    case EntityCategory::Supply: return "supply";
    case EntityCategory::Defense: return "defense";
    }
    return "economy";
}

const char *to_string(FormatRevision revision) {
    return revision == FormatRevision::Remastered ? "remastered" : "legacy";
}

bool is_valid_race_code(uint8_t code) {
    return code == static_cast<uint8_t>(Race::Zerg) ||
           code == static_cast<uint8_t>(Race::Terran) ||
           code == static_cast<uint8_t>(Race::Protoss) ||
           code == static_cast<uint8_t>(Race::Random);
}

} // namespace replay
