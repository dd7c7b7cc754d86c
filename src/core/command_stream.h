/**
 * @file command_stream.h
 * @brief Décodeur du flux de commandes synchronisé sur les frames
 *
 * Le flux alterne des marqueurs d'avance de frame (0x00 à 0x03) et des
 * enregistrements opcode / joueur / paramètres. La seule variable d'état est
 * la frame courante, qui ne fait que croître : les commandes émises sont donc
 * ordonnées par frame. Un opcode inconnu déclenche une resynchronisation, un
 * enregistrement tronqué ou le plafond d'itérations termine la boucle sans
 * erreur.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../formats/opcode_catalog.h"
#include "../replay_types.hpp"
#include "../utilities.hpp"

namespace replay {

class ByteCursor;

struct CommandStreamResult {
    std::vector<Command> commands;
    uint32_t final_frame = 0;
    size_t dropped = 0;         // joueur hors plage
    size_t unknown_opcodes = 0;
    size_t resyncs = 0;
    size_t iterations = 0;
    bool hit_iteration_cap = false;
    bool ended_by_underrun = false;
    std::vector<std::string> issues;
};

class CommandStreamDecoder {
public:
    explicit CommandStreamDecoder(DecoderOptions options = {}) : m_options(options) {}

    /**
     * @brief Décode une section de commandes complète
     *
     * @param section Octets à partir du début de la section de commandes
     * @return Commandes émises et compteurs ; jamais d'exception
     */
    CommandStreamResult decode(std::span<const std::byte> section) const;

    // Paramètres typés d'un enregistrement selon la disposition de l'opcode.
    static CommandParams decode_params(const OpcodeDescriptor &desc,
                                       std::span<const uint8_t> raw);

private:
    // Lit un enregistrement de longueur variable selon la règle configurée.
    std::optional<std::vector<uint8_t>> read_variable(ByteCursor &cursor) const;

    DecoderOptions m_options;
};

} // namespace replay
