#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "engine/dice.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace d20 {

// ==============================================================================
// Factory Parameters
// ==============================================================================

// The abstract Test creature, built from six numbers
struct TestStats {
    i32 attack = 0;         // Total attack modifier including proficiency
    i32 armor_class = 10;
    i32 damage = 0;         // Damage per round
    i32 hit_points = 1;
    i32 attacks = 1;        // Attacks per round
    i32 proficiency = 2;
};

struct CombatantParams {
    u8 level = 1;           // Party level for player characters
    TestStats test{};
};

// Builds a ready-to-fight combatant. Monsters roll their hit points here.
using CombatantFactory = Combatant (*)(const CombatantParams& params, DiceRoller& dice);

struct CatalogEntry {
    std::string name;
    Team team = Team::Monsters;
    CombatantFactory create = nullptr;
};

// ==============================================================================
// Combatant Registry - Name-keyed factories for every party class and monster
// ==============================================================================

class CombatantRegistry {
public:
    static CombatantRegistry& instance() {
        static CombatantRegistry registry;
        return registry;
    }

    void register_entry(std::string_view name, Team team, CombatantFactory create) {
        auto it = index_.find(std::string(name));
        if (it != index_.end()) {
            entries_[it->second] = CatalogEntry{std::string(name), team, create};
            return;
        }
        index_[std::string(name)] = entries_.size();
        entries_.push_back(CatalogEntry{std::string(name), team, create});
    }

    // Names are case-sensitive
    const CatalogEntry* find(std::string_view name) const {
        auto it = index_.find(std::string(name));
        if (it != index_.end()) return &entries_[it->second];
        return nullptr;
    }

    const CatalogEntry* find(std::string_view name, Team team) const {
        const CatalogEntry* entry = find(name);
        return entry != nullptr && entry->team == team ? entry : nullptr;
    }

    // Names of one side, in registration order
    std::vector<std::string> names(Team team) const {
        std::vector<std::string> result;
        for (const auto& e : entries_) {
            if (e.team == team) result.push_back(e.name);
        }
        return result;
    }

    size_t size() const { return entries_.size(); }

    bool is_initialized() const { return initialized_; }
    void set_initialized(bool val) { initialized_ = val; }

private:
    CombatantRegistry() = default;

    std::vector<CatalogEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
    bool initialized_ = false;
};

inline CombatantRegistry& get_combatant_registry() {
    return CombatantRegistry::instance();
}

// Registers the party classes and the bestiary. Safe to call from several
// threads; only the first call does any work.
void initialize_catalog();

} // namespace d20
