// Forme JSON d'un DecodeResult (nlohmann::json).
//
// Les conversions to_json/from_json sont symétriques : un résultat converti
// puis relu est égal à l'original. Les champs purement informatifs (temps
// "m:ss" des commandes, nom d'opcode) sont ignorés à la relecture.
#pragma once

#include <nlohmann/json.hpp>

#include "replay_types.hpp"
#include "utilities.hpp"

namespace replay {

NLOHMANN_JSON_SERIALIZE_ENUM(FormatRevision, {
    {FormatRevision::Legacy, "legacy"},
    {FormatRevision::Remastered, "remastered"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Race, {
    {Race::Zerg, "Zerg"},
    {Race::Terran, "Terran"},
    {Race::Protoss, "Protoss"},
    {Race::Random, "Random"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ParticipantKind, {
    {ParticipantKind::Empty, "empty"},
    {ParticipantKind::Computer, "computer"},
    {ParticipantKind::Human, "human"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ResolveTier, {
    {ResolveTier::Primary, "primary"},
    {ResolveTier::Alternate, "alternate"},
    {ResolveTier::Scan, "scan"},
    {ResolveTier::Placeholder, "placeholder"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(PayloadMode, {
    {PayloadMode::Uncompressed, "uncompressed"},
    {PayloadMode::Inflated, "inflated"},
    {PayloadMode::RawFallback, "raw-fallback"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Reliability, {
    {Reliability::High, "high"},
    {Reliability::Medium, "medium"},
    {Reliability::Low, "low"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ActionKind, {
    {ActionKind::None, "None"},
    {ActionKind::Build, "Build"},
    {ActionKind::Train, "Train"},
    {ActionKind::Morph, "Morph"},
    {ActionKind::Research, "Research"},
    {ActionKind::Upgrade, "Upgrade"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(EntityCategory, {
    {EntityCategory::Economy, "economy"},
    {EntityCategory::Military, "military"},
    {EntityCategory::Tech, "tech"},
    {EntityCategory::Supply, "supply"},
    {EntityCategory::Defense, "defense"},
})

void to_json(nlohmann::json &j, const ReplayHeader &h);
void from_json(const nlohmann::json &j, ReplayHeader &h);

void to_json(nlohmann::json &j, const PlayerRecord &p);
void from_json(const nlohmann::json &j, PlayerRecord &p);

// Paramètres : objet avec un champ "kind" qui désigne la variante.
void params_to_json(nlohmann::json &j, const CommandParams &params);
CommandParams params_from_json(const nlohmann::json &j);

void to_json(nlohmann::json &j, const Command &c);
void from_json(const nlohmann::json &j, Command &c);

void to_json(nlohmann::json &j, const SupplySnapshot &s);
void from_json(const nlohmann::json &j, SupplySnapshot &s);

void to_json(nlohmann::json &j, const BuildOrderEntry &e);
void from_json(const nlohmann::json &j, BuildOrderEntry &e);

void to_json(nlohmann::json &j, const StrategicSummary &s);
void from_json(const nlohmann::json &j, StrategicSummary &s);

void to_json(nlohmann::json &j, const IneffectiveBreakdown &b);
void from_json(const nlohmann::json &j, IneffectiveBreakdown &b);

void to_json(nlohmann::json &j, const AnalyticsSummary &a);
void from_json(const nlohmann::json &j, AnalyticsSummary &a);

void to_json(nlohmann::json &j, const ParseStatistics &s);
void from_json(const nlohmann::json &j, ParseStatistics &s);

void to_json(nlohmann::json &j, const DecodeResult &r);
void from_json(const nlohmann::json &j, DecodeResult &r);

// Document d'export : résultat complet, liste de commandes éventuellement
// limitée à opt.sample_commands, durée de partie "m:ss".
nlohmann::json export_document(const DecodeResult &result, const DecoderOptions &opt);

} // namespace replay
