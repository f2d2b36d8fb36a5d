#pragma once

#include "catalog/registry.hpp"
#include <string>
#include <vector>

namespace d20 {

// ==============================================================================
// Bestiary
// Monster factories keyed by their catalog name. Hit points are rolled from
// the monster's hit dice on every call.
// ==============================================================================

// max(1, NdS + N * CON)
i32 roll_monster_hp(const Dice& hit_dice, i8 con, DiceRoller& dice);

Combatant make_bandit(const CombatantParams& params, DiceRoller& dice);
Combatant make_giant_rat(const CombatantParams& params, DiceRoller& dice);
Combatant make_kobold(const CombatantParams& params, DiceRoller& dice);
Combatant make_goblin(const CombatantParams& params, DiceRoller& dice);
Combatant make_wolf(const CombatantParams& params, DiceRoller& dice);
Combatant make_zombie(const CombatantParams& params, DiceRoller& dice);
Combatant make_orc(const CombatantParams& params, DiceRoller& dice);
Combatant make_hobgoblin(const CombatantParams& params, DiceRoller& dice);
Combatant make_gnoll(const CombatantParams& params, DiceRoller& dice);
Combatant make_ghoul(const CombatantParams& params, DiceRoller& dice);
Combatant make_ogre(const CombatantParams& params, DiceRoller& dice);

// Abstract creature with the numbers of params.test
Combatant make_test_creature(const CombatantParams& params, DiceRoller& dice);

// Stats the Test creature cannot represent exactly; empty when they all fit
std::vector<std::string> test_stats_problems(const TestStats& stats);

// "Test(attack,ac,damage,hp,attacks,proficiency)"
std::string test_creature_label(const TestStats& stats);

void register_bestiary(CombatantRegistry& registry);

} // namespace d20
