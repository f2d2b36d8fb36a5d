#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "engine/encounter.hpp"
#include <string>
#include <utility>
#include <vector>

namespace d20 {

// ==============================================================================
// Shared turn helpers for party and monster behaviors
// ==============================================================================

// Conscious members of the combatant's side, the combatant included
inline u32 conscious_allies(const Combatant& self, const Encounter& encounter) {
    u32 count = 0;
    for (const Combatant* c : encounter.allies_of(self)) {
        if (c->is_conscious()) ++count;
    }
    return count;
}

// Pack Tactics, Martial Advantage and Sneak Attack all need a conscious ally
inline bool ally_nearby(const Combatant& self, const Encounter& encounter) {
    return conscious_allies(self, encounter) > 1;
}

inline bool any_conscious_foe(const Combatant& self, const Encounter& encounter) {
    return encounter.any_target(self, TargetFilter::foes());
}

// Whether any foe still in play is immune to the damage type
inline bool any_foe_immune(const Combatant& self, const Encounter& encounter, DamageType type) {
    for (const Combatant* c : encounter.foes_of(self)) {
        if (!c->is_destroyed() && c->immune_to(type)) return true;
    }
    return false;
}

// Stealth check with the bonus action; attacking gives the position away
inline void hide(Combatant& self, Encounter& encounter) {
    self.bonus_action = false;
    self.stealth = static_cast<i32>(encounter.dice().roll(20)) + self.skill_modifier(Skill::Stealth, Ability::Dex);
    if (encounter.resolver().tracing()) {
        encounter.resolver().note(label(self) + " hides (Stealth " + std::to_string(self.stealth) + ")");
    }
}

// Up to n distinct picks, uniformly without replacement
inline std::vector<Combatant*> sample(std::vector<Combatant*> pool, u32 n, DiceRoller& dice) {
    if (n >= pool.size()) return pool;
    for (u32 i = 0; i < n; ++i) {
        const u32 j = i + dice.pick_index(static_cast<u32>(pool.size()) - i);
        std::swap(pool[i], pool[j]);
    }
    pool.resize(n);
    return pool;
}

// Up to n targets: every candidate when they all fit, otherwise the preferred
// ones first and the rest drawn at random from the others
inline std::vector<Combatant*> prioritized_targets(std::vector<Combatant*> preferred,
                                                  std::vector<Combatant*> others,
                                                  u32 n, DiceRoller& dice) {
    if (preferred.size() + others.size() <= n) {
        preferred.insert(preferred.end(), others.begin(), others.end());
        return preferred;
    }
    if (preferred.size() >= n) return sample(std::move(preferred), n, dice);

    const u32 fill = n - static_cast<u32>(preferred.size());
    std::vector<Combatant*> extra = sample(std::move(others), fill, dice);
    preferred.insert(preferred.end(), extra.begin(), extra.end());
    return preferred;
}

} // namespace d20
