#pragma once

#include "core/types.hpp"
#include <string_view>

namespace d20 {

// ==============================================================================
// On-hit riders carried by a weapon
// ==============================================================================

enum class OnHitEffect : u8 {
    None     = 0,
    Prone    = 1,   // Target saves or is knocked prone
    Paralyze = 2    // Target saves or is paralyzed (repeat save each turn)
};

// ==============================================================================
// Weapon - Immutable attack definition owned by the combatant that uses it.
// Spell attacks are built as short-lived Weapon values too.
// ==============================================================================

struct Weapon {
    Name name;
    Dice dice;
    DamageType damage_type = DamageType::Bludgeoning;
    Ability ability        = Ability::Str;
    bool proficient        = true;
    bool add_ability       = true;    // Ability modifier added to damage
    bool is_spell          = false;   // Uses the caster's spell attack bonus

    Dice secondary_dice{};            // Extra damage of another type (doubled on crits)
    DamageType secondary_type = DamageType::Radiant;

    i8 attack_modifier = 0;
    i8 damage_modifier = 0;

    OnHitEffect on_hit  = OnHitEffect::None;
    Ability on_hit_save = Ability::Str;
    u8 on_hit_dc        = 0;

    Weapon() = default;

    Weapon(std::string_view weapon_name, Dice d, DamageType type, Ability abil = Ability::Str)
        : name(weapon_name), dice(d), damage_type(type), ability(abil) {}

    bool has_secondary() const { return !secondary_dice.empty(); }
    bool has_rider() const { return on_hit != OnHitEffect::None; }

    // Copy with extra damage dice of the same type (sneak attack, martial advantage)
    Weapon with_extra_dice(u8 count, u8 sides) const {
        Weapon w = *this;
        if (w.dice.sides == sides) {
            w.dice = w.dice.plus(count);
        } else {
            w.secondary_dice = Dice(count, sides);
            w.secondary_type = damage_type;
        }
        return w;
    }

    Weapon with_magic_bonus(i8 bonus) const {
        Weapon w = *this;
        w.attack_modifier = static_cast<i8>(w.attack_modifier + bonus);
        w.damage_modifier = static_cast<i8>(w.damage_modifier + bonus);
        switch (w.damage_type) {
            case DamageType::Bludgeoning: w.damage_type = DamageType::MagicBludgeoning; break;
            case DamageType::Piercing:    w.damage_type = DamageType::MagicPiercing; break;
            case DamageType::Slashing:    w.damage_type = DamageType::MagicSlashing; break;
            default: break;
        }
        return w;
    }

    Weapon with_rider(OnHitEffect effect, Ability save, u8 dc) const {
        Weapon w = *this;
        w.on_hit = effect;
        w.on_hit_save = save;
        w.on_hit_dc = dc;
        return w;
    }
};

// ==============================================================================
// Spell attack helper
// ==============================================================================

inline Weapon spell_attack(std::string_view name, Dice dice, DamageType type) {
    Weapon w(name, dice, type);
    w.is_spell = true;
    w.add_ability = false;
    return w;
}

} // namespace d20
