#include "replay_json.hpp"

#include <stdexcept>

#include "formats/opcode_catalog.h"

namespace replay {

using nlohmann::json;

void to_json(json &j, const ReplayHeader &h) {
    j = json{{"signature", h.signature},
             {"revision", h.revision},
             {"engine", h.engine},
             {"frames", h.frames},
             {"map_name", h.map_name},
             {"game_type", h.game_type},
             {"frame_count_confident", h.frame_count_confident},
             {"map_name_confident", h.map_name_confident}};
}

void from_json(const json &j, ReplayHeader &h) {
    j.at("signature").get_to(h.signature);
    j.at("revision").get_to(h.revision);
    j.at("engine").get_to(h.engine);
    j.at("frames").get_to(h.frames);
    j.at("map_name").get_to(h.map_name);
    j.at("game_type").get_to(h.game_type);
    j.at("frame_count_confident").get_to(h.frame_count_confident);
    j.at("map_name_confident").get_to(h.map_name_confident);
}

void to_json(json &j, const PlayerRecord &p) {
    j = json{{"slot", p.slot},
             {"name", p.name},
             {"race", p.race},
             {"team", p.team},
             {"color", p.color},
             {"kind", p.kind}};
}

void from_json(const json &j, PlayerRecord &p) {
    j.at("slot").get_to(p.slot);
    j.at("name").get_to(p.name);
    j.at("race").get_to(p.race);
    j.at("team").get_to(p.team);
    j.at("color").get_to(p.color);
    j.at("kind").get_to(p.kind);
}

void params_to_json(json &j, const CommandParams &params) {
    if (const auto *b = std::get_if<BuildParams>(&params)) {
        j = json{{"kind", "build"}, {"entity_id", b->entity_id}, {"x", b->x}, {"y", b->y}};
    } else if (const auto *e = std::get_if<EntityParams>(&params)) {
        j = json{{"kind", "entity"}, {"entity_id", e->entity_id}};
    } else if (const auto *p = std::get_if<PositionParams>(&params)) {
        j = json{{"kind", "position"}, {"x", p->x}, {"y", p->y}, {"target_id", nullptr}};
        if (p->target_id) {
            j["target_id"] = *p->target_id;
        }
    } else if (const auto *s = std::get_if<SelectParams>(&params)) {
        j = json{{"kind", "select"}, {"count", s->count}, {"entity_type", s->entity_type}};
    } else if (const auto *h = std::get_if<HotkeyParams>(&params)) {
        j = json{{"kind", "hotkey"}, {"action", h->action}, {"index", h->index}};
    } else if (const auto *c = std::get_if<ChatParams>(&params)) {
        j = json{{"kind", "chat"}, {"text", c->text}};
    } else {
        j = json{{"kind", "none"}};
    }
}

CommandParams params_from_json(const json &j) {
    const std::string kind = j.at("kind").get<std::string>();
    if (kind == "build") {
        return BuildParams{j.at("entity_id").get<uint16_t>(), j.at("x").get<uint16_t>(),
                           j.at("y").get<uint16_t>()};
    }
    if (kind == "entity") {
        return EntityParams{j.at("entity_id").get<uint16_t>()};
    }
    if (kind == "position") {
        PositionParams p{j.at("x").get<uint16_t>(), j.at("y").get<uint16_t>(), std::nullopt};
        if (j.contains("target_id") && !j.at("target_id").is_null()) {
            p.target_id = j.at("target_id").get<uint16_t>();
        }
        return p;
    }
    if (kind == "select") {
        return SelectParams{j.at("count").get<uint8_t>(), j.at("entity_type").get<uint16_t>()};
    }
    if (kind == "hotkey") {
        return HotkeyParams{j.at("action").get<uint8_t>(), j.at("index").get<uint8_t>()};
    }
    if (kind == "chat") {
        return ChatParams{j.at("text").get<std::string>()};
    }
    if (kind == "none") {
        return std::monostate{};
    }
    throw std::runtime_error("Type de paramètres inconnu : " + kind);
}

void to_json(json &j, const Command &c) {
    json params;
    params_to_json(params, c.params);
    auto desc = lookup_opcode(c.opcode);
    j = json{{"frame", c.frame},
             {"time", frames_to_time(c.frame, kFramesPerSecond)},
             {"player", c.player},
             {"opcode", c.opcode},
             {"name", desc ? std::string(desc->name) : hex_byte(c.opcode)},
             {"effective", c.effective},
             {"params", params},
             {"raw", c.raw}};
}

void from_json(const json &j, Command &c) {
    j.at("frame").get_to(c.frame);
    j.at("player").get_to(c.player);
    j.at("opcode").get_to(c.opcode);
    j.at("effective").get_to(c.effective);
    c.params = params_from_json(j.at("params"));
    j.at("raw").get_to(c.raw);
}

void to_json(json &j, const SupplySnapshot &s) {
    j = json{{"frame", s.frame},
             {"current", s.current},
             {"maximum", s.maximum},
             {"blocked", s.blocked}};
}

void from_json(const json &j, SupplySnapshot &s) {
    j.at("frame").get_to(s.frame);
    j.at("current").get_to(s.current);
    j.at("maximum").get_to(s.maximum);
    j.at("blocked").get_to(s.blocked);
}

void to_json(json &j, const BuildOrderEntry &e) {
    j = json{{"frame", e.frame},
             {"time", e.time},
             {"action", e.action},
             {"entity_id", e.entity_id},
             {"entity_name", e.entity_name},
             {"category", e.category},
             {"minerals", e.minerals},
             {"gas", e.gas},
             {"supply", e.supply},
             {"confidence", e.confidence},
             {"inferred", e.inferred},
             {"note", e.note}};
}

void from_json(const json &j, BuildOrderEntry &e) {
    j.at("frame").get_to(e.frame);
    j.at("time").get_to(e.time);
    j.at("action").get_to(e.action);
    j.at("entity_id").get_to(e.entity_id);
    j.at("entity_name").get_to(e.entity_name);
    j.at("category").get_to(e.category);
    j.at("minerals").get_to(e.minerals);
    j.at("gas").get_to(e.gas);
    j.at("supply").get_to(e.supply);
    j.at("confidence").get_to(e.confidence);
    j.at("inferred").get_to(e.inferred);
    j.at("note").get_to(e.note);
}

void to_json(json &j, const StrategicSummary &s) {
    j = json{{"opening", s.opening},
             {"tech_path", s.tech_path},
             {"economic_rating", s.economic_rating},
             {"military_rating", s.military_rating},
             {"strengths", s.strengths},
             {"weaknesses", s.weaknesses},
             {"recommendations", s.recommendations}};
}

void from_json(const json &j, StrategicSummary &s) {
    j.at("opening").get_to(s.opening);
    j.at("tech_path").get_to(s.tech_path);
    j.at("economic_rating").get_to(s.economic_rating);
    j.at("military_rating").get_to(s.military_rating);
    j.at("strengths").get_to(s.strengths);
    j.at("weaknesses").get_to(s.weaknesses);
    j.at("recommendations").get_to(s.recommendations);
}

void to_json(json &j, const IneffectiveBreakdown &b) {
    j = json{{"fast_repetition", b.fast_repetition},
             {"fast_reselection", b.fast_reselection},
             {"repetition", b.repetition},
             {"hotkey_repetition", b.hotkey_repetition}};
}

void from_json(const json &j, IneffectiveBreakdown &b) {
    j.at("fast_repetition").get_to(b.fast_repetition);
    j.at("fast_reselection").get_to(b.fast_reselection);
    j.at("repetition").get_to(b.repetition);
    j.at("hotkey_repetition").get_to(b.hotkey_repetition);
}

void to_json(json &j, const AnalyticsSummary &a) {
    j = json{{"player", a.player},
             {"command_count", a.command_count},
             {"effective_count", a.effective_count},
             {"apm", a.apm},
             {"eapm", a.eapm},
             {"efficiency", a.efficiency},
             {"build_order", a.build_order},
             {"supply_history", a.supply_history},
             {"strategy", a.strategy},
             {"ineffective", a.ineffective}};
}

void from_json(const json &j, AnalyticsSummary &a) {
    j.at("player").get_to(a.player);
    j.at("command_count").get_to(a.command_count);
    j.at("effective_count").get_to(a.effective_count);
    j.at("apm").get_to(a.apm);
    j.at("eapm").get_to(a.eapm);
    j.at("efficiency").get_to(a.efficiency);
    j.at("build_order").get_to(a.build_order);
    j.at("supply_history").get_to(a.supply_history);
    j.at("strategy").get_to(a.strategy);
    j.at("ineffective").get_to(a.ineffective);
}

void to_json(json &j, const ParseStatistics &s) {
    j = json{{"input_bytes", s.input_bytes},
             {"body_bytes", s.body_bytes},
             {"payload", s.payload},
             {"frame_tier", s.frame_tier},
             {"map_tier", s.map_tier},
             {"roster_tier", s.roster_tier},
             {"command_offset", s.command_offset},
             {"commands_decoded", s.commands_decoded},
             {"commands_dropped", s.commands_dropped},
             {"unknown_opcodes", s.unknown_opcodes},
             {"resyncs", s.resyncs},
             {"final_frame", s.final_frame},
             {"frames_inferred", s.frames_inferred},
             {"hit_iteration_cap", s.hit_iteration_cap},
             {"ended_by_underrun", s.ended_by_underrun},
             {"reliability", s.reliability},
             {"errors", s.errors}};
}

void from_json(const json &j, ParseStatistics &s) {
    j.at("input_bytes").get_to(s.input_bytes);
    j.at("body_bytes").get_to(s.body_bytes);
    j.at("payload").get_to(s.payload);
    j.at("frame_tier").get_to(s.frame_tier);
    j.at("map_tier").get_to(s.map_tier);
    j.at("roster_tier").get_to(s.roster_tier);
    j.at("command_offset").get_to(s.command_offset);
    j.at("commands_decoded").get_to(s.commands_decoded);
    j.at("commands_dropped").get_to(s.commands_dropped);
    j.at("unknown_opcodes").get_to(s.unknown_opcodes);
    j.at("resyncs").get_to(s.resyncs);
    j.at("final_frame").get_to(s.final_frame);
    j.at("frames_inferred").get_to(s.frames_inferred);
    j.at("hit_iteration_cap").get_to(s.hit_iteration_cap);
    j.at("ended_by_underrun").get_to(s.ended_by_underrun);
    j.at("reliability").get_to(s.reliability);
    j.at("errors").get_to(s.errors);
}

void to_json(json &j, const DecodeResult &r) {
    j = json{{"header", r.header},
             {"players", r.players},
             {"commands", r.commands},
             {"analytics", r.analytics},
             {"stats", r.stats}};
}

void from_json(const json &j, DecodeResult &r) {
    j.at("header").get_to(r.header);
    j.at("players").get_to(r.players);
    j.at("commands").get_to(r.commands);
    j.at("analytics").get_to(r.analytics);
    j.at("stats").get_to(r.stats);
}

json export_document(const DecodeResult &result, const DecoderOptions &opt) {
    json doc = result;
    doc["game_length"] = frames_to_time(result.header.frames, kFramesPerSecond);
    doc["commands_total"] = result.commands.size();
    if (opt.sample_commands > 0 && result.commands.size() > opt.sample_commands) {
        auto &commands = doc["commands"];
        commands.erase(commands.begin() + static_cast<std::ptrdiff_t>(opt.sample_commands),
                       commands.end());
    }
    return doc;
}

} // namespace replay
