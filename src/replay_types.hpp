// Modèle de données d'un replay décodé, partagé par les étapes du décodeur
// et par l'export JSON.
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace replay {

// Constantes du format
inline constexpr double kFramesPerSecond = 24.0;
inline constexpr size_t kMaxPlayerSlots = 8;
inline constexpr size_t kSignatureOffset = 12;
inline constexpr size_t kSignatureSize = 4;
inline constexpr size_t kPrologSize = kSignatureOffset + kSignatureSize;
inline constexpr size_t kHeaderSize = 0x279;
inline constexpr uint32_t kMaxPlausibleFrames = 1'000'000;
inline constexpr int kMaxSupply = 200;

// Levée quand la signature ne correspond à aucune valeur acceptée ; seule
// condition qui interrompt un décodage.
class InvalidFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class FormatRevision : uint8_t {
    Legacy,    // "reRS", corps non compressé
    Remastered // "seRS", corps deflate
};

enum class Race : uint8_t {
    Zerg = 0,
    Terran = 1,
    Protoss = 2,
    Random = 6
};

enum class ParticipantKind : uint8_t {
    Empty = 0,
    Computer = 1,
    Human = 2
};

// Couche de résolution qui a fourni une valeur.
enum class ResolveTier : uint8_t {
    Primary,
    Alternate,
    Scan,
    Placeholder
};

enum class PayloadMode : uint8_t {
    Uncompressed, // aucun en-tête de flux compressé après le prologue
    Inflated,
    RawFallback   // en-tête trouvé mais aucune tentative validée
};

enum class Reliability : uint8_t {
    High,
    Medium,
    Low
};

enum class ActionKind : uint8_t {
    None,
    Build,
    Train,
    Morph,
    Research,
    Upgrade
};

enum class EntityCategory : uint8_t {
    Economy,
    Military,
    Tech,
    Supply,
    Defense
};

struct ReplayHeader {
    std::string signature;
    FormatRevision revision = FormatRevision::Legacy;
    uint8_t engine = 0;
    uint32_t frames = 0;
    std::string map_name;
    uint16_t game_type = 0;
    bool frame_count_confident = false;
    bool map_name_confident = false;

    bool operator==(const ReplayHeader &) const = default;
};

struct PlayerRecord {
    uint8_t slot = 0;
    std::string name;
    Race race = Race::Random;
    uint8_t team = 0;
    uint8_t color = 0;
    ParticipantKind kind = ParticipantKind::Human;

    bool operator==(const PlayerRecord &) const = default;
};

// Paramètres d'une commande, une variante par disposition.
struct BuildParams {
    uint16_t entity_id = 0;
    uint16_t x = 0;
    uint16_t y = 0;
    bool operator==(const BuildParams &) const = default;
};

struct EntityParams {
    uint16_t entity_id = 0;
    bool operator==(const EntityParams &) const = default;
};

struct PositionParams {
    uint16_t x = 0;
    uint16_t y = 0;
    std::optional<uint16_t> target_id;
    bool operator==(const PositionParams &) const = default;
};

struct SelectParams {
    uint8_t count = 0;
    uint16_t entity_type = 0;
    bool operator==(const SelectParams &) const = default;
};

struct HotkeyParams {
    uint8_t action = 0;
    uint8_t index = 0;
    bool operator==(const HotkeyParams &) const = default;
};

struct ChatParams {
    std::string text;
    bool operator==(const ChatParams &) const = default;
};

using CommandParams = std::variant<std::monostate, BuildParams, EntityParams,
                                   PositionParams, SelectParams, HotkeyParams,
                                   ChatParams>;

struct Command {
    uint32_t frame = 0;
    uint8_t player = 0;
    uint8_t opcode = 0;
    CommandParams params;
    std::vector<uint8_t> raw; // octets de paramètres après l'octet joueur
    bool effective = false;

    bool operator==(const Command &) const = default;
};

struct SupplySnapshot {
    uint32_t frame = 0;
    int current = 0;
    int maximum = 0;
    bool blocked = false;

    bool operator==(const SupplySnapshot &) const = default;
};

struct BuildOrderEntry {
    uint32_t frame = 0;
    std::string time;
    ActionKind action = ActionKind::None;
    uint16_t entity_id = 0;
    std::string entity_name;
    EntityCategory category = EntityCategory::Economy;
    int minerals = 0;
    int gas = 0;
    SupplySnapshot supply;
    int confidence = 0; // 0..100
    bool inferred = false;
    std::string note;

    bool operator==(const BuildOrderEntry &) const = default;
};

// Classification heuristique, jamais garantie.
struct StrategicSummary {
    std::string opening;
    std::vector<std::string> tech_path;
    int economic_rating = 50;
    int military_rating = 50;
    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
    std::vector<std::string> recommendations;

    bool operator==(const StrategicSummary &) const = default;
};

// Commandes jugées inefficaces par les règles de répétition sur fenêtre.
struct IneffectiveBreakdown {
    size_t fast_repetition = 0;
    size_t fast_reselection = 0;
    size_t repetition = 0;
    size_t hotkey_repetition = 0;

    bool operator==(const IneffectiveBreakdown &) const = default;
};

struct AnalyticsSummary {
    uint8_t player = 0;
    size_t command_count = 0;
    size_t effective_count = 0;
    double apm = 0.0;
    double eapm = 0.0;
    int efficiency = 0;
    std::vector<BuildOrderEntry> build_order;
    std::vector<SupplySnapshot> supply_history;
    StrategicSummary strategy;
    IneffectiveBreakdown ineffective;

    bool operator==(const AnalyticsSummary &) const = default;
};

struct ParseStatistics {
    size_t input_bytes = 0;
    size_t body_bytes = 0;
    PayloadMode payload = PayloadMode::Uncompressed;
    ResolveTier frame_tier = ResolveTier::Primary;
    ResolveTier map_tier = ResolveTier::Primary;
    ResolveTier roster_tier = ResolveTier::Primary;
    size_t command_offset = 0;
    size_t commands_decoded = 0;
    size_t commands_dropped = 0;
    size_t unknown_opcodes = 0;
    size_t resyncs = 0;
    uint32_t final_frame = 0;
    bool frames_inferred = false;
    bool hit_iteration_cap = false;
    bool ended_by_underrun = false;
    Reliability reliability = Reliability::Low;
    std::vector<std::string> errors;

    bool operator==(const ParseStatistics &) const = default;
};

struct DecodeResult {
    ReplayHeader header;
    std::vector<PlayerRecord> players;
    std::vector<Command> commands;
    std::vector<AnalyticsSummary> analytics; // même ordre que players
    ParseStatistics stats;

    bool operator==(const DecodeResult &) const = default;
};

const char *to_string(Race race);
const char *to_string(ParticipantKind kind);
const char *to_string(ResolveTier tier);
const char *to_string(PayloadMode mode);
const char *to_string(Reliability reliability);
const char *to_string(ActionKind kind);
const char *to_string(EntityCategory category);
const char *to_string(FormatRevision revision);

// Codes de race acceptés dans un emplacement joueur.
bool is_valid_race_code(uint8_t code);

} // namespace replay
