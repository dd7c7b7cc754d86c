#include "replay_decoder.hpp"

#include <algorithm>

#include "analysis/analytics_engine.h"
#include "core/command_stream.h"
#include "core/container_decoder.h"
#include "formats/payload_expander.h"

namespace replay {

namespace {

bool is_fallback(ResolveTier tier) {
    return tier == ResolveTier::Alternate || tier == ResolveTier::Scan;
}

} // namespace

Reliability assess_reliability(const ParseStatistics &stats) {
    if (stats.roster_tier == ResolveTier::Placeholder ||
        (stats.map_tier == ResolveTier::Placeholder &&
         stats.frame_tier == ResolveTier::Placeholder) ||
        stats.commands_decoded == 0) {
        return Reliability::Low;
    }
    if (is_fallback(stats.frame_tier) || is_fallback(stats.map_tier) ||
        is_fallback(stats.roster_tier) || stats.payload == PayloadMode::RawFallback ||
        stats.frame_tier == ResolveTier::Placeholder || stats.commands_dropped > 0 ||
        stats.resyncs > 0 || stats.hit_iteration_cap || stats.ended_by_underrun ||
        stats.commands_decoded < kHighReliabilityCommands) {
        return Reliability::Medium;
    }
    return Reliability::High;
}

DecodeResult decode_replay(std::span<const std::byte> data, const DecoderOptions &opt) {
    const Signature signature = check_signature(data);

    DecodeResult result;
    ParseStatistics &stats = result.stats;
    stats.input_bytes = data.size();

    PayloadExpansion payload = expand_payload(data, signature.revision, opt);
    stats.payload = payload.mode;
    stats.body_bytes = payload.body.size();
    stats.errors.insert(stats.errors.end(), payload.issues.begin(), payload.issues.end());
    const std::span<const std::byte> body(payload.body);

    ContainerResult container = decode_container(body, signature, opt);
    result.header = std::move(container.header);
    result.players = std::move(container.players);
    stats.frame_tier = container.frame_tier;
    stats.map_tier = container.map_tier;
    stats.roster_tier = container.roster_tier;
    stats.command_offset = container.command_offset;
    stats.errors.insert(stats.errors.end(), container.issues.begin(), container.issues.end());

    const CommandStreamDecoder commandDecoder(opt);
    CommandStreamResult stream = commandDecoder.decode(body.subspan(container.command_offset));
    stats.final_frame = stream.final_frame;
    stats.unknown_opcodes = stream.unknown_opcodes;
    stats.resyncs = stream.resyncs;
    stats.hit_iteration_cap = stream.hit_iteration_cap;
    stats.ended_by_underrun = stream.ended_by_underrun;
    stats.errors.insert(stats.errors.end(), stream.issues.begin(), stream.issues.end());

    // Seules les commandes d'un joueur du roster sont conservées
    size_t orphaned = 0;
    for (auto &cmd : stream.commands) {
        const bool known = std::any_of(result.players.begin(), result.players.end(),
                                       [&](const PlayerRecord &p) { return p.slot == cmd.player; });
        if (known) {
            result.commands.push_back(std::move(cmd));
        } else {
            ++orphaned;
        }
    }
    if (orphaned > 0) {
        stats.errors.push_back("commands: " + std::to_string(orphaned) +
                               " command(s) for players outside the roster dropped");
        log_warn("commandes", std::to_string(orphaned) +
                                  " commande(s) sans joueur correspondant ignorée(s)",
                 opt);
    }
    stats.commands_dropped = stream.dropped + orphaned;
    stats.commands_decoded = result.commands.size();

    if (!result.header.frame_count_confident && stream.final_frame > 0) {
        result.header.frames = stream.final_frame;
        stats.frames_inferred = true;
        stats.errors.push_back("header: frame count inferred from command stream (" +
                               std::to_string(stream.final_frame) + ")");
    }

    const AnalyticsEngine analytics(opt);
    result.analytics = analytics.analyze(result.header, result.players, result.commands);

    stats.reliability = assess_reliability(stats);
    log_info("replay", result.header.map_name + ", " + std::to_string(result.players.size()) +
                           " joueur(s), " + std::to_string(stats.commands_decoded) +
                           " commande(s), fiabilité " + to_string(stats.reliability),
             opt);
    return result;
}

DecodeResult decode_replay_file(const std::string &path, const DecoderOptions &opt) {
    const std::vector<std::byte> bytes = read_file_bytes(path);
    return decode_replay(bytes, opt);
}

} // namespace replay
