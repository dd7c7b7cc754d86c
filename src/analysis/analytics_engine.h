/**
 * @file analytics_engine.h
 * @brief Statistiques dérivées des commandes : APM/EAPM, ordre de
 *        construction, population, résumé stratégique
 *
 * Tout est recalculé à partir des commandes décodées ; rien n'est conservé
 * entre deux appels.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../formats/entity_catalog.h"
#include "../formats/opcode_catalog.h"
#include "../replay_types.hpp"
#include "../utilities.hpp"

namespace replay {

// En dessous de ce score, une entrée d'ordre de construction est présumée.
inline constexpr int kConfidentThreshold = 60;

// Scores par méthode de résolution de l'identifiant d'entité
inline constexpr int kConfidenceDirect = 100;
inline constexpr int kConfidenceNamePattern = 70;
inline constexpr int kConfidenceSiblingScan = 45;
inline constexpr int kConfidenceInferred = 15;

// Fenêtre (en frames) des règles de répétition
inline constexpr uint32_t kIneffectiveWindow = 24;
inline constexpr uint32_t kFastRepetitionFrames = 12;

// Nombre d'entrées examinées pour l'ouverture
inline constexpr size_t kOpeningEntries = 10;

struct ActionRates {
    size_t count = 0;
    size_t effective = 0;
    double apm = 0.0;
    double eapm = 0.0;
    int efficiency = 0;
};

struct EntityResolution {
    EntityDescriptor entity;
    int confidence = 0;
    bool inferred = false;
    std::string method;
};

double game_minutes(uint32_t frames);

// Population de départ selon la race.
SupplySnapshot starting_supply(Race race);

ActionRates compute_rates(std::span<const Command> commands, uint8_t player, uint32_t frames);

// Étiquette de phase de jeu ("Opening", "Early game", ...).
std::string_view phase_note(uint32_t frame);

// Identifiant numérique accolé à un nom d'action ("Train7", "Build 109").
std::optional<uint16_t> entity_id_from_name(std::string_view name);

/**
 * @brief Retrouve l'entité visée par une commande de construction
 *
 * Essaie dans l'ordre : champ de paramètre direct, identifiant dans le nom
 * de l'opcode, balayage des octets de paramètres, puis déduction d'après
 * la race et la phase de jeu. std::nullopt si rien ne convient (race
 * aléatoire sans indice exploitable, action inconnue).
 */
std::optional<EntityResolution> resolve_entity(const Command &cmd, const OpcodeDescriptor &desc,
                                               Race race);

// Classement des commandes répétitives, suivant l'ordre des frames.
IneffectiveBreakdown classify_ineffective(std::span<const Command> playerCommands);

StrategicSummary summarize_strategy(std::span<const BuildOrderEntry> buildOrder, Race race,
                                    const ActionRates &rates,
                                    std::span<const SupplySnapshot> supply);

class AnalyticsEngine {
public:
    explicit AnalyticsEngine(DecoderOptions options = {}) : m_options(options) {}

    // Un résumé par joueur, dans l'ordre du roster.
    std::vector<AnalyticsSummary> analyze(const ReplayHeader &header,
                                          std::span<const PlayerRecord> players,
                                          std::span<const Command> commands) const;

    AnalyticsSummary analyze_player(const PlayerRecord &player, uint32_t frames,
                                    std::span<const Command> commands) const;

private:
    DecoderOptions m_options;
};

} // namespace replay
