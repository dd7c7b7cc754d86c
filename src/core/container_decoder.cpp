#include "container_decoder.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "byte_cursor.h"
#include "layered_resolver.h"

namespace replay {

namespace {

// Champ de n octets à partir de off, raccourci en fin de tampon.
std::span<const std::byte> field_at(std::span<const std::byte> data, size_t off, size_t n) {
    if (off >= data.size()) {
        return {};
    }
    return data.subspan(off, std::min(n, data.size() - off));
}

std::span<const std::byte> until_zero(std::span<const std::byte> field) {
    auto zero = std::find(field.begin(), field.end(), std::byte{0});
    return field.first(static_cast<size_t>(zero - field.begin()));
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

struct PlayerTable {
    size_t base = 0;
    size_t slot_size = kPlayerSlotSize;
    std::vector<PlayerRecord> slots;
};

std::string offset_label(size_t off) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%zx", off);
    return buffer;
}

std::vector<PlayerRecord> select_roster(const std::vector<PlayerRecord> &slots) {
    std::vector<PlayerRecord> humans;
    for (const auto &p : slots) {
        if (p.kind == ParticipantKind::Human) {
            humans.push_back(p);
        }
    }
    if (!humans.empty()) {
        return humans;
    }
    return slots; // uniquement des ordinateurs
}

std::vector<PlayerRecord> placeholder_roster() {
    return {
        PlayerRecord{0, "Player 1", Race::Terran, 0, 0, ParticipantKind::Human},
        PlayerRecord{1, "Player 2", Race::Protoss, 1, 1, ParticipantKind::Human},
    };
}

} // namespace

Signature check_signature(std::span<const std::byte> file) {
    if (file.size() < kPrologSize) {
        throw InvalidFormatError("Fichier trop court pour contenir une signature (" +
                                 std::to_string(file.size()) + " octets)");
    }
    std::string tag;
    for (std::byte b : file.subspan(kSignatureOffset, kSignatureSize)) {
        tag.push_back(static_cast<char>(std::to_integer<uint8_t>(b)));
    }
    if (tag == kLegacySignature) {
        return {tag, FormatRevision::Legacy};
    }
    if (tag == kRemasteredSignature) {
        return {tag, FormatRevision::Remastered};
    }
    std::string shown;
    for (char c : tag) {
        const auto u = static_cast<uint8_t>(c);
        shown += (u >= 0x20 && u <= 0x7E) ? std::string(1, c) : hex_byte(u);
    }
    throw InvalidFormatError("Signature de replay inconnue : " + shown);
}

bool looks_like_text(std::span<const std::byte> field) {
    auto text = until_zero(field);
    if (text.empty()) {
        return false;
    }
    const bool utf8 = is_valid_utf8(text);
    size_t printable = 0;
    bool letter = false;
    size_t run = 0;
    uint8_t previous = 0;
    for (std::byte b : text) {
        const auto c = std::to_integer<uint8_t>(b);
        if ((c >= 0x20 && c <= 0x7E) || (utf8 && c >= 0x80)) {
            ++printable;
        }
        if (std::isalpha(c) || (utf8 && c >= 0x80)) {
            letter = true;
        }
        run = (run > 0 && c == previous) ? run + 1 : 1;
        if (run >= 4) {
            return false;
        }
        previous = c;
    }
    const double ratio = static_cast<double>(printable) / static_cast<double>(text.size());
    return ratio >= 0.7 && letter;
}

bool is_valid_player_name(std::string_view name) {
    const size_t length = utf8_length(name);
    if (length < 2 || length > 24) {
        return false;
    }
    bool visible = false;
    for (char c : name) {
        const auto u = static_cast<uint8_t>(c);
        if (u < 0x20 || u == 0x7F) {
            return false;
        }
        if (u != ' ') {
            visible = true;
        }
    }
    if (!visible) {
        return false;
    }
    for (std::string_view reserved : {"observer", "computer", "open", "closed"}) {
        if (iequals(name, reserved)) {
            return false;
        }
    }
    return true;
}

std::optional<PlayerRecord> decode_player_slot(std::span<const std::byte> slot, uint8_t index) {
    const size_t size = slot.size();
    if (size < kPlayerNameSize + 4) {
        return std::nullopt;
    }
    const auto kind = std::to_integer<uint8_t>(slot[kPlayerKindOffset]);
    if (kind != static_cast<uint8_t>(ParticipantKind::Computer) &&
        kind != static_cast<uint8_t>(ParticipantKind::Human)) {
        return std::nullopt;
    }
    const auto race = std::to_integer<uint8_t>(slot[size - 4]);
    if (!is_valid_race_code(race)) {
        return std::nullopt;
    }
    std::string name = decode_text(slot.first(kPlayerNameSize));
    if (!is_valid_player_name(name)) {
        return std::nullopt;
    }
    PlayerRecord player;
    player.slot = index;
    player.name = std::move(name);
    player.race = static_cast<Race>(race);
    player.team = std::to_integer<uint8_t>(slot[size - 3]);
    player.color = std::to_integer<uint8_t>(slot[size - 2]);
    player.kind = static_cast<ParticipantKind>(kind);
    return player;
}

std::vector<PlayerRecord> decode_player_table(std::span<const std::byte> body, size_t base,
                                              size_t slotSize) {
    std::vector<PlayerRecord> players;
    for (size_t i = 0; i < kMaxPlayerSlots; ++i) {
        const size_t off = base + i * slotSize;
        if (off + slotSize > body.size()) {
            break;
        }
        if (auto p = decode_player_slot(body.subspan(off, slotSize), static_cast<uint8_t>(i))) {
            players.push_back(std::move(*p));
        }
    }
    return players;
}

ContainerResult decode_container(std::span<const std::byte> body, const Signature &signature,
                                  const DecoderOptions &opt) {
    ContainerResult result;
    result.header.signature = signature.tag;
    result.header.revision = signature.revision;

    ByteCursor cursor(body);
    cursor.seek(kEngineOffset);
    result.header.engine = cursor.readU8().value_or(0);

    // Nombre de frames
    auto frameAt = [body](size_t off) {
        return [body, off]() -> std::optional<uint32_t> {
            ByteCursor c(body);
            c.seek(off);
            return c.readU32LE();
        };
    };
    LayeredResolver<uint32_t> frames;
    frames.add(ResolveTier::Primary, offset_label(kFrameCountOffset), frameAt(kFrameCountOffset));
    for (size_t off : kAltFrameCountOffsets) {
        frames.add(ResolveTier::Alternate, offset_label(off), frameAt(off));
    }
    auto plausibleFrames = [](const uint32_t &f) { return f > 0 && f <= kMaxPlausibleFrames; };
    if (auto resolved = frames.resolve(plausibleFrames)) {
        result.header.frames = resolved->value;
        result.header.frame_count_confident = true;
        result.frame_tier = resolved->tier;
        if (resolved->tier != ResolveTier::Primary) {
            result.issues.push_back("header: frame count read at alternate offset " +
                                    resolved->label);
            log_warn("en-tête", "nombre de frames lu à l'offset alternatif " + resolved->label, opt);
        }
    } else {
        result.header.frames = 0;
        result.header.frame_count_confident = false;
        result.frame_tier = ResolveTier::Placeholder;
        result.issues.push_back("header: no plausible frame count, defaulted to 0");
        log_warn("en-tête", "aucun nombre de frames plausible", opt);
    }

    // Type de partie
    auto gameTypeAt = [body](size_t off) {
        return [body, off]() -> std::optional<uint16_t> {
            ByteCursor c(body);
            c.seek(off);
            return c.readU16LE();
        };
    };
    LayeredResolver<uint16_t> gameType;
    gameType.add(ResolveTier::Primary, offset_label(kGameTypeOffset), gameTypeAt(kGameTypeOffset));
    for (size_t off : kAltGameTypeOffsets) {
        gameType.add(ResolveTier::Alternate, offset_label(off), gameTypeAt(off));
    }
    auto plausibleGameType = [](const uint16_t &t) { return t > 0 && t <= kMaxGameType; };
    if (auto resolved = gameType.resolve(plausibleGameType)) {
        result.header.game_type = resolved->value;
        if (resolved->tier != ResolveTier::Primary) {
            result.issues.push_back("header: game type read at alternate offset " +
                                    resolved->label);
            log_warn("en-tête", "type de partie lu à l'offset alternatif " + resolved->label, opt);
        }
    } else {
        result.header.game_type = 0;
        result.issues.push_back("header: no plausible game type, defaulted to 0");
        log_warn("en-tête", "aucun type de partie plausible", opt);
    }

    // Table des joueurs
    auto tableAt = [body](size_t base) {
        return [body, base]() -> std::optional<PlayerTable> {
            return PlayerTable{base, kPlayerSlotSize,
                               decode_player_table(body, base, kPlayerSlotSize)};
        };
    };
    LayeredResolver<PlayerTable> roster;
    roster.add(ResolveTier::Primary, offset_label(kPlayerTableOffset), tableAt(kPlayerTableOffset));
    for (size_t off : kAltPlayerTableOffsets) {
        roster.add(ResolveTier::Alternate, offset_label(off), tableAt(off));
    }
    roster.add(ResolveTier::Scan, "balayage", [body]() -> std::optional<PlayerTable> {
        const size_t end = std::min(kPlayerScanEnd, body.size());
        for (size_t base = 0; base < end; ++base) {
            // Une table commence par un emplacement valide ; à base égale,
            // la taille d'emplacement qui décode le plus de joueurs l'emporte.
            std::optional<PlayerTable> best;
            for (size_t slotSize : kScanSlotSizes) {
                auto slots = decode_player_table(body, base, slotSize);
                if (slots.empty() || slots.front().slot != 0) {
                    continue;
                }
                if (!best || slots.size() > best->slots.size()) {
                    best = PlayerTable{base, slotSize, std::move(slots)};
                }
            }
            if (best) {
                return best;
            }
        }
        return std::nullopt;
    });

    size_t commandOffset = kHeaderSize;
    // Octets occupés par la table retenue, exclus du balayage du nom de carte
    size_t tableBegin = 0;
    size_t tableEnd = 0;
    if (auto resolved = roster.resolve([](const PlayerTable &t) { return !t.slots.empty(); })) {
        result.players = select_roster(resolved->value.slots);
        result.roster_tier = resolved->tier;
        tableBegin = resolved->value.base;
        tableEnd = tableBegin + kMaxPlayerSlots * resolved->value.slot_size;
        commandOffset = std::max(kHeaderSize, tableEnd);
        if (resolved->tier != ResolveTier::Primary) {
            result.issues.push_back(std::string("roster: player table resolved by ") +
                                    to_string(resolved->tier) + " at " +
                                    offset_label(resolved->value.base) + ", slot size " +
                                    std::to_string(resolved->value.slot_size));
            log_warn("joueurs", "table des joueurs trouvée à " +
                                    offset_label(resolved->value.base) + " (" +
                                    to_string(resolved->tier) + ")",
                     opt);
        }
    } else {
        result.players = placeholder_roster();
        result.roster_tier = ResolveTier::Placeholder;
        result.issues.push_back("roster: no valid player slot, synthesized two placeholder players");
        log_warn("joueurs", "aucun joueur valide, joueurs génériques créés", opt);
    }

    // Nom de carte
    using Field = std::span<const std::byte>;
    auto mapAt = [body](size_t off) {
        return [body, off]() -> std::optional<Field> {
            auto field = field_at(body, off, kMapNameSize);
            if (field.empty()) {
                return std::nullopt;
            }
            return field;
        };
    };
    LayeredResolver<Field> mapName;
    mapName.add(ResolveTier::Primary, offset_label(kMapNameOffset), mapAt(kMapNameOffset));
    for (size_t off : kAltMapNameOffsets) {
        mapName.add(ResolveTier::Alternate, offset_label(off), mapAt(off));
    }
    mapName.add(ResolveTier::Scan, "balayage", [body, tableBegin, tableEnd]() -> std::optional<Field> {
        const size_t end = std::min(kMapScanEnd, body.size());
        for (size_t p = 0; p < end; ++p) {
            if (body[p] == std::byte{0} || (p > 0 && body[p - 1] != std::byte{0})) {
                continue;
            }
            if (p >= tableBegin && p < tableEnd) {
                continue; // nom de joueur
            }
            auto candidate = until_zero(field_at(body, p, kMapNameSize));
            if (candidate.size() >= 3 && looks_like_text(candidate)) {
                return candidate;
            }
        }
        return std::nullopt;
    });
    if (auto resolved = mapName.resolve([](const Field &f) { return looks_like_text(f); })) {
        result.header.map_name = decode_text(resolved->value);
        result.header.map_name_confident = true;
        result.map_tier = resolved->tier;
        if (resolved->tier != ResolveTier::Primary) {
            result.issues.push_back(std::string("header: map name resolved by ") +
                                    to_string(resolved->tier) + " (" + resolved->label + ")");
            log_warn("en-tête", "nom de carte obtenu par repli (" + resolved->label + ")", opt);
        }
    } else {
        result.header.map_name = std::string(kPlaceholderMapName);
        result.header.map_name_confident = false;
        result.map_tier = ResolveTier::Placeholder;
        result.issues.push_back("header: map name not found, using placeholder");
        log_warn("en-tête", "nom de carte introuvable", opt);
    }

    result.command_offset = std::min(commandOffset, body.size());
    return result;
}

} // namespace replay
