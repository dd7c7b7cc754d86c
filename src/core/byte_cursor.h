/**
 * @file byte_cursor.h
 * @brief Lecteur little-endian borné sur un tampon immuable
 *
 * Aucune lecture ne dépasse la fin du tampon : une lecture impossible
 * renvoie std::nullopt et lève le drapeau underrun(). L'appelant décide
 * si la fin de données est fatale (champs d'en-tête) ou normale
 * (boucle de commandes).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace replay {

class ByteCursor {
public:
    explicit ByteCursor(std::span<const std::byte> data) : m_data(data) {}

    bool canRead(size_t n) const { return n <= m_data.size() - m_pos; }

    std::optional<uint8_t> readU8();
    std::optional<uint16_t> readU16LE();
    std::optional<uint32_t> readU32LE();

    /**
     * @brief Lit n octets bruts
     */
    std::optional<std::vector<uint8_t>> readBytes(size_t n);

    /**
     * @brief Lit n octets, tronque au premier octet nul et décode en texte
     *
     * Décodage UTF-8 strict d'abord (caractères de contrôle retirés), sinon
     * filtrage ASCII imprimable octet par octet.
     */
    std::optional<std::string> readFixedString(size_t n);

    // Octet suivant sans avancer.
    std::optional<uint8_t> peekU8() const;

    // Positionne le curseur, borné à la taille du tampon.
    void seek(size_t pos);

    // Avance de n octets ; false (et curseur en fin) si n dépasse le reste.
    bool skip(size_t n);

    size_t position() const { return m_pos; }
    size_t size() const { return m_data.size(); }
    size_t remaining() const { return m_data.size() - m_pos; }
    bool atEnd() const { return m_pos >= m_data.size(); }
    bool underrun() const { return m_underrun; }
    std::span<const std::byte> data() const { return m_data; }

private:
    std::span<const std::byte> take(size_t n);

    std::span<const std::byte> m_data;
    size_t m_pos = 0;
    bool m_underrun = false;
};

// Décodage permissif d'un champ texte (utilisé pour les noms de joueurs).
std::string decode_text(std::span<const std::byte> bytes);

} // namespace replay
