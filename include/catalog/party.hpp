#pragma once

#include "catalog/registry.hpp"
#include <algorithm>
#include <array>

namespace d20 {

// ==============================================================================
// Player Characters
// Cleric (Life Domain), Fighter (Champion), Rogue (Assassin) and Wizard
// (Evocation), levels 1 to 8. Factories return a character fresh from a long
// rest.
// ==============================================================================

inline constexpr u8 proficiency_for_level(u8 level) {
    return static_cast<u8>((level - 1) / 4 + 2);
}

// Maximum at first level, then the rounded-up mean per level
inline i32 character_max_hp(const Dice& hit_die, u8 level, i8 con) {
    const i32 mean = hit_die.sides / 2 + 1;
    return std::max<i32>(1, hit_die.sides - mean + level * (mean + con));
}

// Spell slots per spell level for a full caster
std::array<u8, MAX_SPELL_LEVEL> full_caster_slots(u8 level);

Combatant make_cleric(const CombatantParams& params, DiceRoller& dice);
Combatant make_fighter(const CombatantParams& params, DiceRoller& dice);
Combatant make_rogue(const CombatantParams& params, DiceRoller& dice);
Combatant make_wizard(const CombatantParams& params, DiceRoller& dice);

void register_party(CombatantRegistry& registry);

} // namespace d20
