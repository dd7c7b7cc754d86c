#include "analytics_engine.h"

#include <algorithm>
#include <cmath>
#include <regex>

namespace replay {

namespace {

int clamp_rating(int value) {
    return std::clamp(value, 0, 100);
}

bool race_matches(const EntityDescriptor &e, Race race) {
    return race == Race::Random || e.race == race;
}

std::optional<uint16_t> direct_entity_id(const CommandParams &params) {
    if (const auto *build = std::get_if<BuildParams>(&params)) {
        return build->entity_id;
    }
    if (const auto *entity = std::get_if<EntityParams>(&params)) {
        return entity->entity_id;
    }
    return std::nullopt;
}

std::optional<EntityDescriptor> scan_raw_for_entity(std::span<const uint8_t> raw,
                                                    EntityDomain domain, Race race) {
    for (size_t off = 0; off + 1 < raw.size(); ++off) {
        const auto id = static_cast<uint16_t>(raw[off] | (raw[off + 1] << 8));
        if (auto e = lookup_entity(domain, id); e && race_matches(*e, race)) {
            return e;
        }
    }
    for (uint8_t b : raw) {
        if (auto e = lookup_entity(domain, b); e && race_matches(*e, race)) {
            return e;
        }
    }
    return std::nullopt;
}

// Entité la plus probable pour une race, une action et une phase de jeu.
std::optional<std::string_view> probable_entity(Race race, ActionKind action, uint8_t opcode,
                                                double seconds) {
    const bool opening = seconds < 60;
    const bool early = seconds < 300;
    const bool mid = seconds < 600;
    switch (race) {
    case Race::Terran:
        switch (action) {
        case ActionKind::Build:
            return opening ? "Supply Depot" : early ? "Barracks" : mid ? "Factory" : "Starport";
        case ActionKind::Train: return early ? "SCV" : "Marine";
        case ActionKind::Research: return mid ? "Stim Packs" : "Tank Siege Mode";
        case ActionKind::Upgrade: return mid ? "U-238 Shells" : "Terran Infantry Weapons";
        default: return std::nullopt;
        }
    case Race::Zerg:
        switch (action) {
        case ActionKind::Build:
            return opening ? "Spawning Pool" : early ? "Extractor" : mid ? "Spire" : "Evolution Chamber";
        case ActionKind::Train: return early ? "Drone" : "Zergling";
        case ActionKind::Morph:
            if (opcode == 0x21) {
                return "Lurker";
            }
            return mid ? "Lair" : "Hive";
        case ActionKind::Research: return mid ? "Burrowing" : "Lurker Aspect";
        case ActionKind::Upgrade: return mid ? "Metabolic Boost" : "Zerg Missile Attacks";
        default: return std::nullopt;
        }
    case Race::Protoss:
        switch (action) {
        case ActionKind::Build:
            return opening ? "Pylon" : early ? "Gateway" : mid ? "Cybernetics Core" : "Stargate";
        case ActionKind::Train: return early ? "Probe" : "Dragoon";
        case ActionKind::Research: return "Psionic Storm";
        case ActionKind::Upgrade: return mid ? "Singularity Charge" : "Protoss Ground Weapons";
        default: return std::nullopt;
        }
    case Race::Random:
        break;
    }
    return std::nullopt;
}

bool has_entity(std::span<const BuildOrderEntry> entries, std::string_view name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&](const BuildOrderEntry &e) { return e.entity_name == name; });
}

std::optional<uint32_t> first_frame_of(std::span<const BuildOrderEntry> entries,
                                       std::string_view name) {
    for (const auto &e : entries) {
        if (e.entity_name == name) {
            return e.frame;
        }
    }
    return std::nullopt;
}

size_t count_entity(std::span<const BuildOrderEntry> entries, std::string_view name) {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [&](const BuildOrderEntry &e) {
                                                 return e.entity_name == name;
                                             }));
}

std::string opening_of(std::span<const BuildOrderEntry> entries, Race race) {
    auto first = entries.first(std::min(entries.size(), kOpeningEntries));
    switch (race) {
    case Race::Zerg: {
        auto pool = first_frame_of(first, "Spawning Pool");
        auto hatch = first_frame_of(first, "Hatchery");
        if (pool && (!hatch || *pool <= *hatch)) {
            return "Pool First";
        }
        if (hatch) {
            return "Hatch First";
        }
        break;
    }
    case Race::Terran:
        if (has_entity(first, "Factory")) {
            return "Factory";
        }
        if (count_entity(first, "Barracks") == 1) {
            return "1 Rax";
        }
        break;
    case Race::Protoss: {
        const size_t gates = count_entity(first, "Gateway");
        if (gates >= 2) {
            return "2 Gate";
        }
        if (gates == 1) {
            return "1 Gate";
        }
        break;
    }
    case Race::Random:
        break;
    }
    return "Standard";
}

std::vector<std::string> tech_path_of(std::span<const BuildOrderEntry> entries, Race race) {
    std::vector<std::string> path;
    auto any = [&](std::initializer_list<std::string_view> names) {
        return std::any_of(names.begin(), names.end(),
                           [&](std::string_view n) { return has_entity(entries, n); });
    };
    if (race == Race::Terran || race == Race::Random) {
        if (any({"Academy", "Medic", "Firebat", "Stim Packs"})) {
            path.emplace_back("Bio");
        }
        if (any({"Machine Shop", "Siege Tank", "Vulture", "Goliath", "Tank Siege Mode"})) {
            path.emplace_back("Mech");
        }
        if (any({"Starport", "Wraith", "Battlecruiser", "Valkyrie"})) {
            path.emplace_back("Air");
        }
    }
    if (race == Race::Protoss || race == Race::Random) {
        if (any({"Robotics Facility", "Reaver", "Observer", "Shuttle"})) {
            path.emplace_back("Robo");
        }
        if (any({"Stargate", "Corsair", "Carrier", "Scout"})) {
            path.emplace_back("Air");
        }
    }
    if (race == Race::Zerg || race == Race::Random) {
        if (any({"Spire", "Mutalisk"})) {
            path.emplace_back("Mutalisk");
        }
    }
    std::sort(path.begin(), path.end());
    path.erase(std::unique(path.begin(), path.end()), path.end());
    if (path.empty()) {
        path.emplace_back("Standard");
    }
    return path;
}

} // namespace

double game_minutes(uint32_t frames) {
    return static_cast<double>(frames) / kFramesPerSecond / 60.0;
}

SupplySnapshot starting_supply(Race race) {
    const int maximum = race == Race::Terran ? 10 : 9;
    return SupplySnapshot{0, 4, maximum, false};
}

ActionRates compute_rates(std::span<const Command> commands, uint8_t player, uint32_t frames) {
    ActionRates rates;
    for (const auto &c : commands) {
        if (c.player != player) {
            continue;
        }
        ++rates.count;
        if (c.effective) {
            ++rates.effective;
        }
    }
    const double minutes = game_minutes(frames);
    if (minutes <= 0.0) {
        return rates;
    }
    rates.apm = static_cast<double>(rates.count) / minutes;
    rates.eapm = static_cast<double>(rates.effective) / minutes;
    if (rates.apm > 0.0) {
        rates.efficiency = static_cast<int>(std::lround(rates.eapm / rates.apm * 100.0));
    }
    return rates;
}

std::string_view phase_note(uint32_t frame) {
    const double seconds = static_cast<double>(frame) / kFramesPerSecond;
    if (seconds < 60) {
        return "Opening";
    }
    if (seconds < 300) {
        return "Early game";
    }
    if (seconds < 600) {
        return "Mid game";
    }
    return "Late game";
}

std::optional<uint16_t> entity_id_from_name(std::string_view name) {
    static const std::regex pattern(R"((?:Build|Train|Morph|Research|Upgrade)\s*#?(\d{1,5}))",
                                    std::regex::icase);
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(name.begin(), name.end(), match, pattern)) {
        return std::nullopt;
    }
    const unsigned long value = std::stoul(match[1].str());
    if (value > 0xFFFF) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::optional<EntityResolution> resolve_entity(const Command &cmd, const OpcodeDescriptor &desc,
                                               Race race) {
    if (desc.action == ActionKind::None) {
        return std::nullopt;
    }
    const EntityDomain domain = domain_for(desc.action);

    if (auto id = direct_entity_id(cmd.params)) {
        if (auto e = lookup_entity(domain, *id)) {
            return EntityResolution{*e, kConfidenceDirect, false, "direct"};
        }
    }
    if (auto id = entity_id_from_name(desc.name)) {
        if (auto e = lookup_entity(domain, *id)) {
            return EntityResolution{*e, kConfidenceNamePattern, false, "name pattern"};
        }
    }
    if (auto e = scan_raw_for_entity(cmd.raw, domain, race)) {
        return EntityResolution{*e, kConfidenceSiblingScan, false, "parameter scan"};
    }
    const double seconds = static_cast<double>(cmd.frame) / kFramesPerSecond;
    if (auto name = probable_entity(race, desc.action, cmd.opcode, seconds)) {
        if (auto e = find_entity(domain, *name)) {
            return EntityResolution{*e, kConfidenceInferred, true, "inferred from race and phase"};
        }
    }
    return std::nullopt;
}

IneffectiveBreakdown classify_ineffective(std::span<const Command> playerCommands) {
    IneffectiveBreakdown breakdown;
    size_t windowStart = 0;
    for (size_t i = 0; i < playerCommands.size(); ++i) {
        const Command &cmd = playerCommands[i];
        while (windowStart < i && cmd.frame - playerCommands[windowStart].frame > kIneffectiveWindow) {
            ++windowStart;
        }
        auto recent = playerCommands.subspan(windowStart, i - windowStart);

        const Command *lastSame = nullptr;
        size_t selections = 0;
        bool exactRepeat = false;
        bool sameHotkey = false;
        for (const auto &prev : recent) {
            if (prev.opcode == cmd.opcode) {
                lastSame = &prev;
                if (prev.raw == cmd.raw) {
                    exactRepeat = true;
                }
                if (cmd.opcode == 0x13 && prev.raw.size() >= 2 && cmd.raw.size() >= 2 &&
                    prev.raw[1] == cmd.raw[1]) {
                    sameHotkey = true;
                }
            }
            if (prev.opcode == 0x09 || prev.opcode == 0x0A) {
                ++selections;
            }
        }

        if (lastSame && cmd.frame - lastSame->frame < kFastRepetitionFrames) {
            ++breakdown.fast_repetition;
        } else if ((cmd.opcode == 0x09 || cmd.opcode == 0x0A) && selections > 2) {
            ++breakdown.fast_reselection;
        } else if (exactRepeat) {
            ++breakdown.repetition;
        } else if (sameHotkey) {
            ++breakdown.hotkey_repetition;
        }
    }
    return breakdown;
}

StrategicSummary summarize_strategy(std::span<const BuildOrderEntry> buildOrder, Race race,
                                    const ActionRates &rates,
                                    std::span<const SupplySnapshot> supply) {
    StrategicSummary summary;
    summary.opening = opening_of(buildOrder, race);
    summary.tech_path = tech_path_of(buildOrder, race);

    size_t workers = 0;
    size_t townHalls = 0;
    size_t armyUnits = 0;
    size_t production = 0;
    std::optional<uint32_t> firstMilitary;
    for (const auto &e : buildOrder) {
        auto entity = find_entity(domain_for(e.action), e.entity_name);
        const bool building = entity && entity->building;
        if (e.category == EntityCategory::Economy) {
            if (!building) {
                ++workers;
            } else if (entity->provides > 0) {
                ++townHalls;
            }
        }
        if (e.category == EntityCategory::Military) {
            if (building) {
                ++production;
            } else {
                ++armyUnits;
                if (!firstMilitary) {
                    firstMilitary = e.frame;
                }
            }
        }
    }
    summary.economic_rating = clamp_rating(30 + 4 * static_cast<int>(workers) +
                                           15 * static_cast<int>(townHalls));
    summary.military_rating = clamp_rating(20 + 4 * static_cast<int>(armyUnits) +
                                           8 * static_cast<int>(production));

    if (summary.economic_rating >= 70) {
        summary.strengths.emplace_back("Strong worker production");
    }
    if (summary.military_rating >= 70) {
        summary.strengths.emplace_back("Consistent army production");
    }
    if (rates.apm >= 150.0) {
        summary.strengths.emplace_back("High action speed");
    }
    if (rates.count > 0 && rates.efficiency >= 70) {
        summary.strengths.emplace_back("Efficient actions");
    }

    if (workers < 3) {
        summary.weaknesses.emplace_back("Low worker production");
        summary.recommendations.emplace_back("Produce workers continuously");
    }
    const bool blocked = std::any_of(supply.begin(), supply.end(),
                                     [](const SupplySnapshot &s) { return s.blocked; });
    if (blocked) {
        summary.weaknesses.emplace_back("Supply blocked");
        summary.recommendations.emplace_back("Build supply ahead of production");
    }
    const uint32_t lateMilitary = static_cast<uint32_t>(6 * 60 * kFramesPerSecond);
    if (!firstMilitary || *firstMilitary > lateMilitary) {
        summary.weaknesses.emplace_back("Late military production");
        summary.recommendations.emplace_back("Start army production earlier");
    }
    if (race == Race::Protoss) {
        auto gateway = first_frame_of(buildOrder, "Gateway");
        auto pylon = first_frame_of(buildOrder, "Pylon");
        if (gateway && (!pylon || *pylon > *gateway)) {
            summary.weaknesses.emplace_back("Gateway before Pylon");
            summary.recommendations.emplace_back("Place a Pylon before production buildings");
        }
        if (has_entity(buildOrder, "Dragoon") && !has_entity(buildOrder, "Cybernetics Core")) {
            summary.weaknesses.emplace_back("Dragoon without Cybernetics Core");
            summary.recommendations.emplace_back("Build a Cybernetics Core before advanced units");
        }
    }
    if (rates.count > 0 && rates.efficiency < 60) {
        summary.weaknesses.emplace_back("Low action efficiency");
        summary.recommendations.emplace_back("Reduce spam clicks and repeated selections");
    }
    return summary;
}

AnalyticsSummary AnalyticsEngine::analyze_player(const PlayerRecord &player, uint32_t frames,
                                                 std::span<const Command> commands) const {
    AnalyticsSummary summary;
    summary.player = player.slot;

    const ActionRates rates = compute_rates(commands, player.slot, frames);
    summary.command_count = rates.count;
    summary.effective_count = rates.effective;
    summary.apm = rates.apm;
    summary.eapm = rates.eapm;
    summary.efficiency = rates.efficiency;

    std::vector<Command> own;
    for (const auto &c : commands) {
        if (c.player == player.slot) {
            own.push_back(c);
        }
    }
    summary.ineffective = classify_ineffective(own);

    SupplySnapshot supply = starting_supply(player.race);
    const int startMax = supply.maximum;
    summary.supply_history.push_back(supply);
    size_t skipped = 0;

    for (const auto &cmd : own) {
        auto desc = lookup_opcode(cmd.opcode);
        if (!desc || desc->action == ActionKind::None) {
            continue;
        }
        auto resolution = resolve_entity(cmd, *desc, player.race);
        if (!resolution) {
            ++skipped;
            continue;
        }
        const EntityDescriptor &entity = resolution->entity;

        const int before = supply.current;
        const int beforeMax = supply.maximum;
        if (desc->action == ActionKind::Train) {
            supply.current += entity.supply;
        }
        if ((desc->action == ActionKind::Train || desc->action == ActionKind::Build) &&
            entity.provides > 0) {
            supply.maximum = std::min(kMaxSupply, supply.maximum + entity.provides);
        }
        if (desc->action == ActionKind::Build && entity.building && entity.race == Race::Zerg) {
            // Le drone est consommé par la construction
            supply.current = std::max(0, supply.current - 1);
        }
        supply.maximum = std::max(supply.maximum, startMax);
        supply.frame = cmd.frame;
        supply.blocked = supply.current >= supply.maximum;
        if (supply.current != before || supply.maximum != beforeMax) {
            summary.supply_history.push_back(supply);
        }

        BuildOrderEntry entry;
        entry.frame = cmd.frame;
        entry.time = frames_to_time(cmd.frame, kFramesPerSecond);
        entry.action = desc->action;
        entry.entity_id = entity.id;
        entry.entity_name = std::string(entity.name);
        entry.category = entity.category;
        entry.minerals = entity.minerals;
        entry.gas = entity.gas;
        entry.supply = supply;
        entry.confidence = resolution->confidence;
        entry.inferred = resolution->inferred;
        entry.note = std::string(phase_note(cmd.frame));
        if (resolution->confidence < kConfidentThreshold) {
            entry.note += " (" + resolution->method + ")";
        }
        summary.build_order.push_back(std::move(entry));
    }

    if (skipped > 0) {
        log_info("analyse", player.name + " : " + std::to_string(skipped) +
                                " action(s) de construction sans entité identifiable",
                 m_options);
    }

    summary.strategy = summarize_strategy(summary.build_order, player.race, rates,
                                          summary.supply_history);
    return summary;
}

std::vector<AnalyticsSummary> AnalyticsEngine::analyze(const ReplayHeader &header,
                                                       std::span<const PlayerRecord> players,
                                                       std::span<const Command> commands) const {
    std::vector<AnalyticsSummary> result;
    result.reserve(players.size());
    for (const auto &player : players) {
        result.push_back(analyze_player(player, header.frames, commands));
    }
    return result;
}

} // namespace replay
