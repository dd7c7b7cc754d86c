// Point d'entrée du décodage : octets du fichier -> DecodeResult.
//
// Enchaîne la vérification de signature, l'extraction du corps (zlib),
// l'en-tête et les joueurs, le flux de commandes puis les statistiques.
// Chaque appel est indépendant : aucun état partagé, utilisable depuis
// plusieurs threads sur des tampons différents.
#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "replay_types.hpp"
#include "utilities.hpp"

namespace replay {

// Seuil de commandes en dessous duquel un décodage n'est pas jugé fiable.
inline constexpr size_t kHighReliabilityCommands = 500;

// Décode un replay complet.
// @throws InvalidFormatError si la signature est absente ou inconnue
DecodeResult decode_replay(std::span<const std::byte> data, const DecoderOptions &opt = {});

// Charge puis décode un fichier.
// @throws InvalidFormatError, runtime_error (lecture du fichier)
DecodeResult decode_replay_file(const std::string &path, const DecoderOptions &opt = {});

// Niveau de fiabilité déduit des couches de repli utilisées et des compteurs.
Reliability assess_reliability(const ParseStatistics &stats);

} // namespace replay
