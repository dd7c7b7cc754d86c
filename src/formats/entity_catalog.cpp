#include "entity_catalog.h"

#include <algorithm>
#include <cctype>

namespace replay {

namespace {

using enum EntityCategory;
constexpr Race T = Race::Terran;
constexpr Race Z = Race::Zerg;
constexpr Race P = Race::Protoss;

constexpr EntityDescriptor unit(uint16_t id, std::string_view name, Race race,
                                EntityCategory category, int minerals, int gas,
                                int supply, int provides = 0) {
    return {id, EntityDomain::Unit, name, race, category, minerals, gas, supply, provides, false};
}

constexpr EntityDescriptor building(uint16_t id, std::string_view name, Race race,
                                    EntityCategory category, int minerals, int gas,
                                    int provides = 0) {
    return {id, EntityDomain::Unit, name, race, category, minerals, gas, 0, provides, true};
}

constexpr EntityDescriptor tech(uint16_t id, std::string_view name, Race race,
                                int minerals, int gas) {
    return {id, EntityDomain::Tech, name, race, Tech, minerals, gas, 0, 0, false};
}

constexpr EntityDescriptor upgrade(uint16_t id, std::string_view name, Race race,
                                   int minerals, int gas) {
    return {id, EntityDomain::Upgrade, name, race, Tech, minerals, gas, 0, 0, false};
}

constexpr EntityDescriptor kEntities[] = {
    // Terran
    unit(0, "Marine", T, Military, 50, 0, 1),
    unit(1, "Ghost", T, Military, 25, 75, 1),
    unit(2, "Vulture", T, Military, 75, 0, 2),
    unit(3, "Goliath", T, Military, 100, 50, 2),
    unit(5, "Siege Tank", T, Military, 150, 100, 2),
    unit(7, "SCV", T, Economy, 50, 0, 1),
    unit(8, "Wraith", T, Military, 150, 100, 2),
    unit(9, "Science Vessel", T, Military, 100, 225, 2),
    unit(11, "Dropship", T, Military, 100, 100, 2),
    unit(12, "Battlecruiser", T, Military, 400, 300, 6),
    unit(32, "Firebat", T, Military, 50, 25, 1),
    unit(34, "Medic", T, Military, 50, 25, 1),
    unit(58, "Valkyrie", T, Military, 250, 125, 3),
    building(106, "Command Center", T, Economy, 400, 0, 10),
    building(107, "Comsat Station", T, Tech, 50, 50),
    building(108, "Nuclear Silo", T, Tech, 100, 100),
    building(109, "Supply Depot", T, Supply, 100, 0, 8),
    building(110, "Refinery", T, Economy, 100, 0),
    building(111, "Barracks", T, Military, 150, 0),
    building(112, "Academy", T, Tech, 150, 0),
    building(113, "Factory", T, Military, 200, 100),
    building(114, "Starport", T, Military, 150, 100),
    building(115, "Control Tower", T, Tech, 50, 50),
    building(116, "Science Facility", T, Tech, 100, 150),
    building(117, "Covert Ops", T, Tech, 50, 50),
    building(118, "Physics Lab", T, Tech, 50, 50),
    building(120, "Machine Shop", T, Tech, 50, 50),
    building(122, "Engineering Bay", T, Tech, 125, 0),
    building(123, "Armory", T, Tech, 100, 50),
    building(124, "Missile Turret", T, Defense, 75, 0),
    building(125, "Bunker", T, Defense, 100, 0),

    // Zerg
    unit(37, "Zergling", Z, Military, 50, 0, 1),
    unit(38, "Hydralisk", Z, Military, 75, 25, 1),
    unit(39, "Ultralisk", Z, Military, 200, 200, 4),
    unit(41, "Drone", Z, Economy, 50, 0, 1),
    unit(42, "Overlord", Z, Supply, 100, 0, 0, 8),
    unit(43, "Mutalisk", Z, Military, 100, 100, 2),
    unit(44, "Guardian", Z, Military, 50, 100, 2),
    unit(45, "Queen", Z, Military, 100, 100, 2),
    unit(46, "Defiler", Z, Military, 50, 150, 2),
    unit(47, "Scourge", Z, Military, 25, 75, 1),
    unit(62, "Devourer", Z, Military, 150, 50, 2),
    unit(103, "Lurker", Z, Military, 50, 100, 2),
    building(131, "Hatchery", Z, Economy, 300, 0, 1),
    building(132, "Lair", Z, Tech, 150, 100),
    building(133, "Hive", Z, Tech, 200, 150),
    building(134, "Nydus Canal", Z, Tech, 150, 0),
    building(135, "Hydralisk Den", Z, Military, 100, 50),
    building(136, "Defiler Mound", Z, Tech, 100, 100),
    building(137, "Greater Spire", Z, Military, 100, 150),
    building(138, "Queen's Nest", Z, Tech, 150, 100),
    building(139, "Evolution Chamber", Z, Tech, 75, 0),
    building(140, "Ultralisk Cavern", Z, Military, 150, 200),
    building(141, "Spire", Z, Military, 200, 150),
    building(142, "Spawning Pool", Z, Military, 200, 0),
    building(143, "Creep Colony", Z, Defense, 75, 0),
    building(144, "Spore Colony", Z, Defense, 50, 0),
    building(146, "Sunken Colony", Z, Defense, 50, 0),
    building(149, "Extractor", Z, Economy, 50, 0),

    // Protoss
    unit(60, "Corsair", P, Military, 150, 100, 2),
    unit(61, "Dark Templar", P, Military, 125, 100, 2),
    unit(63, "Dark Archon", P, Military, 0, 0, 4),
    unit(64, "Probe", P, Economy, 50, 0, 1),
    unit(65, "Zealot", P, Military, 100, 0, 2),
    unit(66, "Dragoon", P, Military, 125, 50, 2),
    unit(67, "High Templar", P, Military, 50, 150, 2),
    unit(68, "Archon", P, Military, 0, 0, 4),
    unit(69, "Shuttle", P, Military, 200, 0, 2),
    unit(70, "Scout", P, Military, 275, 125, 3),
    unit(71, "Arbiter", P, Military, 100, 350, 4),
    unit(72, "Carrier", P, Military, 350, 250, 6),
    unit(83, "Reaver", P, Military, 200, 100, 4),
    unit(84, "Observer", P, Military, 25, 75, 1),
    building(154, "Nexus", P, Economy, 400, 0, 9),
    building(155, "Robotics Facility", P, Military, 200, 200),
    building(156, "Pylon", P, Supply, 100, 0, 8),
    building(157, "Assimilator", P, Economy, 100, 0),
    building(159, "Observatory", P, Tech, 50, 100),
    building(160, "Gateway", P, Military, 150, 0),
    building(162, "Photon Cannon", P, Defense, 150, 0),
    building(163, "Citadel of Adun", P, Tech, 150, 100),
    building(164, "Cybernetics Core", P, Tech, 200, 0),
    building(165, "Templar Archives", P, Tech, 150, 200),
    building(166, "Forge", P, Tech, 150, 0),
    building(167, "Stargate", P, Military, 150, 150),
    building(169, "Fleet Beacon", P, Tech, 300, 200),
    building(170, "Arbiter Tribunal", P, Tech, 200, 150),
    building(171, "Robotics Support Bay", P, Tech, 150, 100),
    building(172, "Shield Battery", P, Defense, 100, 0),

    // Technologies
    tech(0, "Stim Packs", T, 100, 100),
    tech(1, "Lockdown", T, 200, 200),
    tech(2, "EMP Shockwave", T, 200, 200),
    tech(3, "Spider Mines", T, 100, 100),
    tech(5, "Tank Siege Mode", T, 150, 150),
    tech(7, "Irradiate", T, 200, 200),
    tech(8, "Yamato Gun", T, 100, 100),
    tech(9, "Cloaking Field", T, 150, 150),
    tech(10, "Personnel Cloaking", T, 100, 100),
    tech(11, "Burrowing", Z, 100, 100),
    tech(13, "Spawn Broodlings", Z, 100, 100),
    tech(15, "Plague", Z, 200, 200),
    tech(16, "Consume", Z, 100, 100),
    tech(17, "Ensnare", Z, 100, 100),
    tech(19, "Psionic Storm", P, 200, 200),
    tech(20, "Hallucination", P, 150, 150),
    tech(21, "Recall", P, 150, 150),
    tech(22, "Stasis Field", P, 150, 150),
    tech(24, "Restoration", T, 100, 100),
    tech(25, "Disruption Web", P, 200, 200),
    tech(27, "Mind Control", P, 200, 200),
    tech(30, "Optical Flare", T, 100, 100),
    tech(31, "Maelstrom", P, 100, 100),
    tech(32, "Lurker Aspect", Z, 200, 200),

    // Améliorations (coût du premier niveau)
    upgrade(0, "Terran Infantry Armor", T, 100, 100),
    upgrade(1, "Terran Vehicle Plating", T, 100, 100),
    upgrade(2, "Terran Ship Plating", T, 150, 150),
    upgrade(3, "Zerg Carapace", Z, 150, 150),
    upgrade(4, "Zerg Flyer Carapace", Z, 150, 150),
    upgrade(5, "Protoss Ground Armor", P, 100, 100),
    upgrade(6, "Protoss Air Armor", P, 150, 150),
    upgrade(7, "Terran Infantry Weapons", T, 100, 100),
    upgrade(8, "Terran Vehicle Weapons", T, 100, 100),
    upgrade(9, "Terran Ship Weapons", T, 100, 100),
    upgrade(10, "Zerg Melee Attacks", Z, 100, 100),
    upgrade(11, "Zerg Missile Attacks", Z, 100, 100),
    upgrade(12, "Zerg Flyer Attacks", Z, 100, 100),
    upgrade(13, "Protoss Ground Weapons", P, 100, 100),
    upgrade(14, "Protoss Air Weapons", P, 100, 100),
    upgrade(15, "Protoss Plasma Shields", P, 200, 200),
    upgrade(16, "U-238 Shells", T, 150, 150),
    upgrade(17, "Ion Thrusters", T, 100, 100),
    upgrade(19, "Titan Reactor", T, 150, 150),
    upgrade(20, "Ocular Implants", T, 100, 100),
    upgrade(21, "Moebius Reactor", T, 150, 150),
    upgrade(22, "Apollo Reactor", T, 200, 200),
    upgrade(23, "Colossus Reactor", T, 150, 150),
    upgrade(24, "Ventral Sacs", Z, 200, 200),
    upgrade(25, "Antennae", Z, 150, 150),
    upgrade(26, "Pneumatized Carapace", Z, 150, 150),
    upgrade(27, "Metabolic Boost", Z, 100, 100),
    upgrade(28, "Adrenal Glands", Z, 200, 200),
    upgrade(29, "Muscular Augments", Z, 150, 150),
    upgrade(30, "Grooved Spines", Z, 150, 150),
    upgrade(31, "Gamete Meiosis", Z, 150, 150),
    upgrade(32, "Metasynaptic Node", Z, 150, 150),
    upgrade(33, "Singularity Charge", P, 150, 150),
    upgrade(34, "Leg Enhancements", P, 150, 150),
    upgrade(35, "Scarab Damage", P, 200, 200),
    upgrade(36, "Reaver Capacity", P, 200, 200),
    upgrade(37, "Gravitic Drive", P, 200, 200),
    upgrade(38, "Sensor Array", P, 150, 150),
    upgrade(39, "Gravitic Boosters", P, 150, 150),
    upgrade(40, "Khaydarin Amulet", P, 150, 150),
    upgrade(41, "Apial Sensors", P, 100, 100),
    upgrade(42, "Gravitic Thrusters", P, 200, 200),
    upgrade(43, "Carrier Capacity", P, 100, 100),
    upgrade(44, "Khaydarin Core", P, 150, 150),
    upgrade(47, "Argus Jewel", P, 100, 100),
    upgrade(49, "Argus Talisman", P, 150, 150),
    upgrade(51, "Caduceus Reactor", T, 150, 150),
    upgrade(52, "Chitinous Plating", Z, 150, 150),
    upgrade(53, "Anabolic Synthesis", Z, 200, 200),
    upgrade(54, "Charon Boosters", T, 100, 100),
};

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::span<const EntityDescriptor> entity_table() {
    return kEntities;
}

std::optional<EntityDescriptor> lookup_entity(EntityDomain domain, uint16_t id) {
    auto it = std::find_if(std::begin(kEntities), std::end(kEntities),
                           [&](const EntityDescriptor &e) {
                               return e.domain == domain && e.id == id;
                           });
    if (it == std::end(kEntities)) {
        return std::nullopt;
    }
    return *it;
}

std::optional<EntityDescriptor> find_entity(EntityDomain domain, std::string_view name) {
    auto it = std::find_if(std::begin(kEntities), std::end(kEntities),
                           [&](const EntityDescriptor &e) {
                               return e.domain == domain && iequals(e.name, name);
                           });
    if (it == std::end(kEntities)) {
        return std::nullopt;
    }
    return *it;
}

EntityDomain domain_for(ActionKind action) {
    switch (action) {
    case ActionKind::Research: return EntityDomain::Tech;
    case ActionKind::Upgrade: return EntityDomain::Upgrade;
    default: return EntityDomain::Unit;
    }
}

} // namespace replay
