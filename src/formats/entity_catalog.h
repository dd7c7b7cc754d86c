#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "../replay_types.hpp"

namespace replay {

// Espaces d'identifiants : unités/bâtiments, technologies, améliorations.
enum class EntityDomain : uint8_t {
    Unit,
    Tech,
    Upgrade
};

struct EntityDescriptor {
    uint16_t id;
    EntityDomain domain;
    std::string_view name;
    Race race;
    EntityCategory category;
    int minerals;
    int gas;
    int supply;   // population consommée (paire de zerglings = 1)
    int provides; // population fournie
    bool building;
};

std::span<const EntityDescriptor> entity_table();

std::optional<EntityDescriptor> lookup_entity(EntityDomain domain, uint16_t id);

// Recherche exacte par nom, insensible à la casse.
std::optional<EntityDescriptor> find_entity(EntityDomain domain, std::string_view name);

// Domaine d'identifiants consulté pour une action de construction.
EntityDomain domain_for(ActionKind action);

} // namespace replay
