/**
 * @file layered_resolver.h
 * @brief Résolution d'une valeur par couches successives
 *
 * Une liste ordonnée de tentatives d'extraction (offsets connus, offsets
 * alternatifs, balayage) est évaluée contre un même validateur ; la première
 * valeur acceptée l'emporte et on retient la couche qui l'a produite.
 * Utilisé pour le nombre de frames, le nom de carte et la table des joueurs.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../replay_types.hpp"

namespace replay {

template <typename T>
struct Resolved {
    T value;
    ResolveTier tier = ResolveTier::Primary;
    std::string label; // description de la tentative retenue, pour les messages
};

template <typename T>
class LayeredResolver {
public:
    using Extractor = std::function<std::optional<T>()>;
    using Validator = std::function<bool(const T &)>;

    LayeredResolver &add(ResolveTier tier, std::string label, Extractor extractor) {
        m_attempts.push_back({tier, std::move(label), std::move(extractor)});
        return *this;
    }

    // Évalue les tentatives dans l'ordre d'ajout.
    std::optional<Resolved<T>> resolve(const Validator &accept) const {
        for (const auto &attempt : m_attempts) {
            std::optional<T> candidate = attempt.extract();
            if (candidate && accept(*candidate)) {
                return Resolved<T>{std::move(*candidate), attempt.tier, attempt.label};
            }
        }
        return std::nullopt;
    }

    size_t size() const { return m_attempts.size(); }

private:
    struct Attempt {
        ResolveTier tier;
        std::string label;
        Extractor extract;
    };

    std::vector<Attempt> m_attempts;
};

} // namespace replay
