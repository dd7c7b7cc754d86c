/**
 * @file container_decoder.h
 * @brief Décodage du conteneur : signature, en-tête et table des joueurs
 *
 * Le prologue du fichier porte un identifiant opaque (12 octets) suivi d'une
 * signature de 4 octets. Le corps (éventuellement décompressé) commence par
 * un en-tête de taille fixe dont la disposition varie selon la révision ;
 * chaque champ est résolu par couches (offset principal, offsets alternatifs,
 * balayage, valeur par défaut).
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../replay_types.hpp"
#include "../utilities.hpp"

namespace replay {

inline constexpr std::string_view kLegacySignature = "reRS";
inline constexpr std::string_view kRemasteredSignature = "seRS";

// Disposition principale du corps
inline constexpr size_t kEngineOffset = 0x00;
inline constexpr size_t kFrameCountOffset = 0x01;
inline constexpr size_t kGameTypeOffset = 0x3C;
inline constexpr uint16_t kMaxGameType = 0x21; // Team Capture The Flag
inline constexpr size_t kMapNameOffset = 0x61;
inline constexpr size_t kMapNameSize = 32;
inline constexpr size_t kPlayerTableOffset = 0xA1;
inline constexpr size_t kPlayerSlotSize = 36;
inline constexpr size_t kPlayerNameSize = 25;
inline constexpr size_t kPlayerKindOffset = 25;

// Autres révisions
inline constexpr std::array<size_t, 2> kAltFrameCountOffsets{0x08, 0x0C};
// Même décalage que le nombre de frames
inline constexpr std::array<size_t, 2> kAltGameTypeOffsets{0x43, 0x47};
inline constexpr std::array<size_t, 2> kAltMapNameOffsets{0x45, 0x68};
inline constexpr std::array<size_t, 2> kAltPlayerTableOffsets{0x161, 0x1A1};

// Balayage de dernier recours
inline constexpr size_t kMapScanEnd = kHeaderSize;
inline constexpr size_t kPlayerScanEnd = 0x600;
inline constexpr std::array<size_t, 3> kScanSlotSizes{36, 32, 40};

inline constexpr std::string_view kPlaceholderMapName = "Unknown Map";

struct Signature {
    std::string tag;
    FormatRevision revision;
};

struct ContainerResult {
    ReplayHeader header;
    std::vector<PlayerRecord> players;
    size_t command_offset = 0;
    ResolveTier frame_tier = ResolveTier::Primary;
    ResolveTier map_tier = ResolveTier::Primary;
    ResolveTier roster_tier = ResolveTier::Primary;
    std::vector<std::string> issues;
};

/**
 * @brief Vérifie la signature du prologue
 * @throws InvalidFormatError si le fichier est trop court ou si la
 *         signature ne correspond à aucune des deux valeurs acceptées
 */
Signature check_signature(std::span<const std::byte> file);

// Validateur "ressemble à du texte" pour les noms de carte : au moins 70 %
// d'octets imprimables, au moins une lettre, pas de série de 4 octets égaux.
bool looks_like_text(std::span<const std::byte> field);

// Nom de joueur : 2 à 24 caractères imprimables, hors mots réservés.
bool is_valid_player_name(std::string_view name);

// Décode un emplacement ; std::nullopt si vide ou invalide.
std::optional<PlayerRecord> decode_player_slot(std::span<const std::byte> slot, uint8_t index);

// Décode les 8 emplacements d'une table ; ne garde que les valides.
std::vector<PlayerRecord> decode_player_table(std::span<const std::byte> body, size_t base,
                                              size_t slotSize);

/**
 * @brief Décode l'en-tête et la table des joueurs du corps
 *
 * Ne lève jamais d'exception : chaque repli est consigné dans `issues`.
 */
ContainerResult decode_container(std::span<const std::byte> body, const Signature &signature,
                                 const DecoderOptions &opt);

} // namespace replay
