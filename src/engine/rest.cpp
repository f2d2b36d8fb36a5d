#include "engine/rest.hpp"
#include <algorithm>

namespace d20 {

i32 spend_hit_dice(Combatant& c, DiceRoller& dice) {
    const i32 threshold = c.max_hp - std::min<i32>(c.max_hp / 2, c.hit_die.sides);
    const i32 before = c.hp;

    while (c.hp > 0 && c.hit_dice_remaining > 0 && c.hp <= threshold) {
        --c.hit_dice_remaining;
        const i32 gain = dice.roll(c.hit_die) + c.modifier(Ability::Con);
        c.hp = std::clamp(c.hp + gain, 1, c.max_hp);
    }

    return c.hp - before;
}

void take_short_rest(Combatant& c, DiceRoller& dice) {
    c.reset_conditions();
    if (c.behavior.short_rest != nullptr) c.behavior.short_rest(c, dice);
    c.refill_resources(RestKind::Short);
    spend_hit_dice(c, dice);
}

void take_long_rest(Combatant& c, DiceRoller& dice) {
    c.reset_conditions();
    c.death_ward = false;
    c.reset_hp();
    c.hit_dice_remaining = c.hit_dice_total;
    c.refill_resources(RestKind::Long);
    if (c.behavior.long_rest != nullptr) c.behavior.long_rest(c, dice);
}

} // namespace d20
