#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "engine/encounter.hpp"
#include <span>
#include <string_view>

namespace d20 {

// ==============================================================================
// Spell Templates
// Stateless; every cast reads the caster's state and writes effects through
// the encounter's action resolver.
// ==============================================================================

enum class SpellId : u8 {
    // Cleric
    SacredFlame = 0,
    Bless,
    CureWounds,
    GuidingBolt,
    HealingWord,
    Aid,
    PrayerOfHealing,
    SpiritualWeapon,
    MassHealingWord,
    SpiritGuardians,
    DeathWard,

    // Wizard
    FireBolt,
    AcidSplash,
    PoisonSpray,
    MageArmor,
    BurningHands,
    ChromaticOrb,
    MagicMissile,
    Thunderwave,
    AcidArrow,
    ScorchingRay,
    Fireball,
    LightningBolt,

    COUNT
};

struct Spell {
    SpellId id;
    std::string_view name;
    u8 level;                  // 0 = cantrip
    TurnSlot casting_time;
    bool concentration;
    bool damaging;
    DamageType damage_type;    // Targets immune to it are not chosen
};

const Spell& spell_info(SpellId id);

inline std::string_view spell_name(SpellId id) { return spell_info(id).name; }

// Cantrip damage dice by character level
inline constexpr u8 cantrip_dice_for_level(u8 level) {
    return level >= 17 ? 4 : level >= 11 ? 3 : level >= 5 ? 2 : 1;
}

// Spends the slot (cantrips spend none) and the casting time, and drops any
// earlier concentration when the new spell needs it. Returns false when the
// slot is not available.
bool begin_cast(Combatant& caster, SpellId id, u8 slot, Encounter& encounter);

// ---- Healing ----------------------------------------------------------------

// Healing a spell rolls for one cast, including Disciple of Life
i32 spell_healing(Combatant& caster, SpellId id, u8 slot, Encounter& encounter);

// Casts a healing spell on every target with one roll
void cast_healing(Combatant& caster, SpellId id, u8 slot, std::span<Combatant* const> targets,
                  Encounter& encounter);

void cast_healing(Combatant& caster, SpellId id, u8 slot, Combatant& target, Encounter& encounter);

// ---- Cleric -----------------------------------------------------------------

void cast_sacred_flame(Combatant& caster, Combatant& target, Encounter& encounter);
void cast_bless(Combatant& caster, u8 slot, std::span<Combatant* const> targets, Encounter& encounter);
void cast_guiding_bolt(Combatant& caster, u8 slot, Combatant& target, Encounter& encounter);
void cast_aid(Combatant& caster, u8 slot, std::span<Combatant* const> targets, Encounter& encounter);
void cast_spiritual_weapon(Combatant& caster, u8 slot, Encounter& encounter);
void spiritual_weapon_attack(Combatant& caster, Encounter& encounter);
void cast_spirit_guardians(Combatant& caster, u8 slot, std::span<Combatant* const> targets,
                           Encounter& encounter);

// ---- Wizard -----------------------------------------------------------------

void cast_fire_bolt(Combatant& caster, Combatant& target, Encounter& encounter);
void cast_acid_splash(Combatant& caster, std::span<Combatant* const> targets, Encounter& encounter);
void cast_poison_spray(Combatant& caster, Combatant& target, Encounter& encounter);

// Burning Hands, Thunderwave, Fireball and Lightning Bolt
void cast_area_spell(Combatant& caster, SpellId id, u8 slot, std::span<Combatant* const> targets,
                     Encounter& encounter);

void cast_chromatic_orb(Combatant& caster, u8 slot, Combatant& target, DamageType type,
                        Encounter& encounter);
void cast_magic_missile(Combatant& caster, u8 slot, Encounter& encounter);
void cast_acid_arrow(Combatant& caster, u8 slot, Combatant& target, Encounter& encounter);
void cast_scorching_ray(Combatant& caster, u8 slot, Encounter& encounter);

} // namespace d20
