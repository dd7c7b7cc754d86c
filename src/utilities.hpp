// Utilitaires généraux pour la lecture des replays, la journalisation
// et la conversion des temps de jeu.
//
// Ce fichier fournit :
// - Lecture d'entiers little-endian depuis un tampon mémoire
// - Lecture exacte depuis un flux fichier
// - Options du décodeur (journalisation, limites, règle des opcodes variables)
// - Fonctions de journalisation (info, warn, error)
// - Conversion frames -> "m:ss"
#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <algorithm>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace replay {

// Règle de longueur des enregistrements à taille variable (opcode Chat).
enum class VariableLengthRule {
    NullTerminated, // lit jusqu'à l'octet nul (consommé), au plus max_variable_length
    LengthPrefixed, // un octet de longueur puis les données, borné
    FixedCap        // exactement max_variable_length octets
};

// Plafond d'itérations par défaut de la boucle de commandes.
constexpr size_t kDefaultMaxIterations = 1'000'000;
// Longueur maximale par défaut d'un enregistrement variable.
constexpr size_t kDefaultMaxVariableLength = 80;

// Options de comportement du décodeur.
// Aucune n'est lue depuis l'environnement : l'appelant les fournit.
struct DecoderOptions {
    bool quiet = false;                       // Désactive les messages de log
    size_t max_iterations = kDefaultMaxIterations;
    VariableLengthRule variable_length_rule = VariableLengthRule::NullTerminated;
    size_t max_variable_length = kDefaultMaxVariableLength;
    size_t sample_commands = 0;               // Export JSON : 0 = toutes les commandes
};

// Concept C++20 : restreint un type template aux types entiers uniquement.
template <typename T>
concept Integral = std::is_integral_v<T>;

namespace detail {

// Implémentation interne : assemble T depuis des octets little-endian.
template <Integral T>
T read_scalar_impl(const uint8_t *bytes) {
    T value;
    if constexpr (sizeof(T) == 1) {
        value = static_cast<T>(bytes[0]);
    } else if constexpr (std::endian::native == std::endian::big) {
        std::array<uint8_t, sizeof(T)> swapped_bytes;
        std::reverse_copy(bytes, bytes + sizeof(T), swapped_bytes.begin());
        std::memcpy(&value, swapped_bytes.data(), sizeof(T));
    } else {
        std::memcpy(&value, bytes, sizeof(T));
    }
    return value;
}

} // namespace detail

// Lit un scalaire T little-endian depuis un bloc mémoire (span).
//
// @param data  Bloc de données à lire
// @return      La valeur lue de type T
// @throws runtime_error si le tampon est trop petit
template <Integral T>
inline T read_scalar_le(std::span<const std::byte> data) {
    constexpr size_t size = sizeof(T);
    if (data.size() < size) {
        throw std::runtime_error("Échec de la lecture de " +
                                 std::to_string(size) +
                                 " octets");
    }
    return detail::read_scalar_impl<T>(
        reinterpret_cast<const uint8_t *>(data.data()));
}

// Convertit une taille (size_t) en streamsize de manière sécurisée.
// @throws runtime_error si la taille dépasse la limite de streamsize
std::streamsize checked_streamsize(size_t size);

// Lit exactement `size` octets depuis le flux `f` dans `data`.
//
// En cas de lecture incomplète, le flux est repositionné à sa position
// initiale et une exception est levée.
//
// @throws runtime_error si la lecture est incomplète
void read_exact(std::ifstream &f, void *data, size_t size);

// Charge un fichier complet en mémoire.
// @throws runtime_error si le fichier ne peut pas être ouvert ou lu
std::vector<std::byte> read_file_bytes(const std::string &path);

// Fonctions de journalisation (info, avertissement, erreur).
// Toutes sont désactivées si DecoderOptions::quiet est true.
void log_info(std::string_view source, const std::string &msg,
              const DecoderOptions &opt);
void log_warn(std::string_view source, const std::string &msg,
              const DecoderOptions &opt);
void log_error(std::string_view source, const std::string &msg,
               const DecoderOptions &opt);

// Vérifie qu'une séquence d'octets est de l'UTF-8 bien formé.
bool is_valid_utf8(std::span<const std::byte> bytes);

// Nombre de points de code d'une chaîne UTF-8 valide.
size_t utf8_length(std::string_view text);

// Formate un nombre de frames en "m:ss" pour la cadence donnée.
std::string frames_to_time(uint32_t frames, double framesPerSecond);

// Représentation hexadécimale "0x1f" d'un octet, pour les messages.
std::string hex_byte(uint8_t value);

} // namespace replay
