#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../replay_types.hpp"
#include "../utilities.hpp"

namespace replay {

// Fenêtre du prologue explorée à la recherche d'un en-tête de flux zlib.
inline constexpr size_t kCompressionScanWindow = 64;
// Plafond de la sortie décompressée.
inline constexpr size_t kMaxInflatedSize = 64u * 1024u * 1024u;

// Seuils de plausibilité d'un corps décompressé.
inline constexpr size_t kMinPayloadSize = 64;
inline constexpr double kMinZeroRatio = 0.01;
inline constexpr double kMaxZeroRatio = 0.97;
inline constexpr double kMinPrintableRatio = 0.005;
inline constexpr double kMaxPrintableRatio = 0.90;

struct PayloadExpansion {
    std::vector<std::byte> body;
    PayloadMode mode = PayloadMode::Uncompressed;
    std::optional<size_t> stream_offset; // position absolue de l'en-tête zlib retenu
    std::string attempt;                 // paramétrage qui a réussi
    bool truncated_stream = false;       // sortie partielle acceptée
    std::vector<std::string> issues;
};

// Une tentative de décompression : position relative à l'en-tête détecté
// et paramètre windowBits transmis à inflateInit2.
struct InflateAttempt {
    size_t skip;
    int window_bits;
    const char *label;
};

// Ordre des tentatives : zlib 15, fenêtre lue dans l'en-tête, détection
// zlib/gzip, puis deflate brut après et sur l'en-tête.
std::span<const InflateAttempt> inflate_attempts();

// Vrai si (cmf, flg) forment un en-tête zlib valide (méthode deflate).
bool is_zlib_header(uint8_t cmf, uint8_t flg);

// Heuristique de plausibilité sur un corps candidat.
bool looks_like_game_data(std::span<const std::byte> data);

/**
 * @brief Décompresse un flux deflate avec le windowBits donné
 *
 * Renvoie std::nullopt si zlib signale une erreur de données. Un flux
 * tronqué (entrée épuisée avant la fin) ou une sortie atteignant `cap`
 * donnent la sortie partielle avec `truncated` à true.
 */
std::optional<std::vector<std::byte>> inflate_stream(std::span<const std::byte> input,
                                                     int windowBits, size_t cap,
                                                     bool &truncated);

/**
 * @brief Extrait le corps du replay à partir du fichier complet
 *
 * Le fichier doit contenir au moins le prologue (identifiant + signature).
 * Pour la révision Remastered, recherche un en-tête zlib dans la fenêtre
 * du prologue et essaie chaque paramétrage ; si aucun résultat ne passe
 * la validation, le corps est constitué des octets bruts après le prologue.
 */
PayloadExpansion expand_payload(std::span<const std::byte> file,
                                FormatRevision revision,
                                const DecoderOptions &opt);

} // namespace replay
