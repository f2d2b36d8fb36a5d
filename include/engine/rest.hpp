#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "engine/dice.hpp"

namespace d20 {

// ==============================================================================
// Rests
// ==============================================================================

// Rolls hit dice until hit points pass the larger of half the maximum and
// one die's worth below it. Unconscious characters spend nothing.
// Returns the hit points recovered.
i32 spend_hit_dice(Combatant& c, DiceRoller& dice);

// Clears encounter state, runs the class hook, recharges short-rest resources
// and spends hit dice
void take_short_rest(Combatant& c, DiceRoller& dice);

// Full hit points, hit dice and resources; the class hook then pre-casts its
// long-duration spells
void take_long_rest(Combatant& c, DiceRoller& dice);

} // namespace d20
