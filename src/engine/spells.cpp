#include "engine/spells.hpp"
#include <algorithm>
#include <array>
#include <string>

namespace d20 {

namespace {

constexpr std::array<Spell, static_cast<size_t>(SpellId::COUNT)> SPELLS = {{
    {SpellId::SacredFlame,     "Sacred Flame",      0, TurnSlot::Action,      false, true,  DamageType::Radiant},
    {SpellId::Bless,           "Bless",             1, TurnSlot::Action,      true,  false, DamageType::Radiant},
    {SpellId::CureWounds,      "Cure Wounds",       1, TurnSlot::Action,      false, false, DamageType::Radiant},
    {SpellId::GuidingBolt,     "Guiding Bolt",      1, TurnSlot::Action,      false, true,  DamageType::Radiant},
    {SpellId::HealingWord,     "Healing Word",      1, TurnSlot::BonusAction, false, false, DamageType::Radiant},
    {SpellId::Aid,             "Aid",               2, TurnSlot::Action,      false, false, DamageType::Radiant},
    {SpellId::PrayerOfHealing, "Prayer of Healing", 2, TurnSlot::Action,      false, false, DamageType::Radiant},
    {SpellId::SpiritualWeapon, "Spiritual Weapon",  2, TurnSlot::BonusAction, false, true,  DamageType::Force},
    {SpellId::MassHealingWord, "Mass Healing Word", 3, TurnSlot::BonusAction, false, false, DamageType::Radiant},
    {SpellId::SpiritGuardians, "Spirit Guardians",  3, TurnSlot::Action,      true,  true,  DamageType::Radiant},
    {SpellId::DeathWard,       "Death Ward",        4, TurnSlot::Action,      false, false, DamageType::Radiant},
    {SpellId::FireBolt,        "Fire Bolt",         0, TurnSlot::Action,      false, true,  DamageType::Fire},
    {SpellId::AcidSplash,      "Acid Splash",       0, TurnSlot::Action,      false, true,  DamageType::Acid},
    {SpellId::PoisonSpray,     "Poison Spray",      0, TurnSlot::Action,      false, true,  DamageType::Poison},
    {SpellId::MageArmor,       "Mage Armor",        1, TurnSlot::Action,      false, false, DamageType::Force},
    {SpellId::BurningHands,    "Burning Hands",     1, TurnSlot::Action,      false, true,  DamageType::Fire},
    {SpellId::ChromaticOrb,    "Chromatic Orb",     1, TurnSlot::Action,      false, true,  DamageType::Cold},
    {SpellId::MagicMissile,    "Magic Missile",     1, TurnSlot::Action,      false, true,  DamageType::Force},
    {SpellId::Thunderwave,     "Thunderwave",       1, TurnSlot::Action,      false, true,  DamageType::Thunder},
    {SpellId::AcidArrow,       "Melf's Acid Arrow", 2, TurnSlot::Action,      false, true,  DamageType::Acid},
    {SpellId::ScorchingRay,    "Scorching Ray",     2, TurnSlot::Action,      false, true,  DamageType::Fire},
    {SpellId::Fireball,        "Fireball",          3, TurnSlot::Action,      false, true,  DamageType::Fire},
    {SpellId::LightningBolt,   "Lightning Bolt",    3, TurnSlot::Action,      false, true,  DamageType::Lightning},
}};

// Save-based cantrip: Potent Cantrip turns "no damage on a save" into half
void cantrip_save(Combatant& caster, Combatant& target, Ability ability, i32 damage, DamageType type,
                  std::string_view name, ActionResolver& resolver) {
    if (caster.features.potent_cantrip) {
        resolver.half_save_damage(caster, target, ability, caster.spell_save_dc(), damage, type, name);
    } else {
        resolver.save_or_damage(caster, target, ability, caster.spell_save_dc(), damage, type, name);
    }
}

Dice healing_dice(SpellId id, u8 slot) {
    switch (id) {
        case SpellId::CureWounds:      return Dice(slot, 8);
        case SpellId::HealingWord:     return Dice(slot, 4);
        case SpellId::MassHealingWord: return Dice(static_cast<u8>(slot - 2), 4);
        case SpellId::PrayerOfHealing: return Dice(slot, 8);
        default:                       return Dice();
    }
}

void spiritual_weapon_strike(Combatant& caster, Encounter& encounter) {
    const Duration* weapon = caster.find_condition(DurationKind::SpiritualWeapon, &caster);
    if (weapon == nullptr) return;

    Combatant* target = encounter.choose_target(caster, TargetFilter::foes().of_type(DamageType::Force));
    if (target == nullptr) return;

    Weapon w = spell_attack("Spiritual Weapon", Dice(std::max<u8>(1, weapon->slot / 2), 8), DamageType::Force);
    w.ability = caster.spell_ability;
    w.add_ability = true;
    encounter.resolver().weapon_attack(caster, *target, w);
}

} // namespace

const Spell& spell_info(SpellId id) {
    return SPELLS[static_cast<size_t>(id)];
}

bool begin_cast(Combatant& caster, SpellId id, u8 slot, Encounter& encounter) {
    const Spell& spell = spell_info(id);

    if (spell.level > 0) {
        if (slot < spell.level || !caster.spend_slot(slot)) return false;
    }

    switch (spell.casting_time) {
        case TurnSlot::Action:      caster.action = false; break;
        case TurnSlot::BonusAction: caster.bonus_action = false; break;
        case TurnSlot::Reaction:    caster.reaction = false; break;
        case TurnSlot::Free:        break;
    }

    if (spell.concentration) caster.end_concentration();

    ActionResolver& resolver = encounter.resolver();
    if (resolver.tracing()) {
        std::string text = label(caster) + " casts " + std::string(spell.name);
        if (spell.level > 0) text += " (slot " + std::to_string(slot) + ")";
        resolver.note(std::move(text));
    }
    return true;
}

// ==============================================================================
// Healing
// ==============================================================================

i32 spell_healing(Combatant& caster, SpellId id, u8 slot, Encounter& encounter) {
    ActionResolver& resolver = encounter.resolver();

    if (caster.features.blessed_healer) {
        resolver.heal(caster, caster, 2 + slot, "Blessed Healer");
    }

    i32 amount = resolver.dice().roll(healing_dice(id, slot)) + caster.modifier(caster.spell_ability);
    if (caster.features.disciple_of_life) amount += 2 + slot;
    return amount;
}

void cast_healing(Combatant& caster, SpellId id, u8 slot, std::span<Combatant* const> targets,
                  Encounter& encounter) {
    if (targets.empty() || !begin_cast(caster, id, slot, encounter)) return;

    const i32 amount = spell_healing(caster, id, slot, encounter);
    for (Combatant* target : targets) {
        encounter.resolver().heal(caster, *target, amount, spell_name(id));
    }
}

void cast_healing(Combatant& caster, SpellId id, u8 slot, Combatant& target, Encounter& encounter) {
    Combatant* targets[] = {&target};
    cast_healing(caster, id, slot, targets, encounter);
}

// ==============================================================================
// Cleric
// ==============================================================================

void cast_sacred_flame(Combatant& caster, Combatant& target, Encounter& encounter) {
    if (!begin_cast(caster, SpellId::SacredFlame, 0, encounter)) return;
    if (target.is_hidden_from(caster)) return;

    const i32 damage = encounter.dice().roll(caster.cantrip_dice, 8);
    cantrip_save(caster, target, Ability::Dex, damage, DamageType::Radiant, "Sacred Flame", encounter.resolver());
}

void cast_bless(Combatant& caster, u8 slot, std::span<Combatant* const> targets, Encounter& encounter) {
    if (targets.empty() || !begin_cast(caster, SpellId::Bless, slot, encounter)) return;

    Concentration concentration;
    concentration.effect = DurationKind::Blessed;
    concentration.rounds_remaining = 10;
    for (Combatant* target : targets) {
        Duration d;
        d.kind = DurationKind::Blessed;
        d.source = &caster;
        d.slot = slot;
        encounter.resolver().apply_condition(*target, d);
        concentration.targets.push_back(target);
    }
    caster.concentration = std::move(concentration);
}

void cast_guiding_bolt(Combatant& caster, u8 slot, Combatant& target, Encounter& encounter) {
    if (!begin_cast(caster, SpellId::GuidingBolt, slot, encounter)) return;

    const Weapon bolt = spell_attack("Guiding Bolt", Dice(static_cast<u8>(3 + slot), 6), DamageType::Radiant);
    AttackResult result = encounter.resolver().weapon_attack(caster, target, bolt);

    if (result.hit() && target.is_conscious()) {
        Duration mark;
        mark.kind = DurationKind::GuidingBolt;
        mark.source = &caster;
        mark.anchor = &caster;
        mark.tick_at = TurnBoundary::EndOfTurn;
        mark.rounds_remaining = 2;
        mark.slot = slot;
        encounter.resolver().apply_condition(target, mark);
    }
}

void cast_aid(Combatant& caster, u8 slot, std::span<Combatant* const> targets, Encounter& encounter) {
    if (targets.empty() || !begin_cast(caster, SpellId::Aid, slot, encounter)) return;

    const i32 increase = 5 * (slot - 1);
    for (Combatant* target : targets) {
        if (target->aided) continue;
        target->aided = true;
        target->max_hp += increase;
        encounter.resolver().heal(caster, *target, increase, "Aid");
    }
}

void cast_spiritual_weapon(Combatant& caster, u8 slot, Encounter& encounter) {
    if (!begin_cast(caster, SpellId::SpiritualWeapon, slot, encounter)) return;

    caster.remove_conditions(DurationKind::SpiritualWeapon, &caster);

    Duration weapon;
    weapon.kind = DurationKind::SpiritualWeapon;
    weapon.source = &caster;
    weapon.anchor = &caster;
    weapon.tick_at = TurnBoundary::StartOfTurn;
    weapon.rounds_remaining = 10;
    weapon.slot = slot;
    encounter.resolver().apply_condition(caster, weapon);

    spiritual_weapon_strike(caster, encounter);
}

void spiritual_weapon_attack(Combatant& caster, Encounter& encounter) {
    caster.bonus_action = false;
    spiritual_weapon_strike(caster, encounter);
}

void cast_spirit_guardians(Combatant& caster, u8 slot, std::span<Combatant* const> targets,
                           Encounter& encounter) {
    if (targets.empty() || !begin_cast(caster, SpellId::SpiritGuardians, slot, encounter)) return;

    Concentration concentration;
    concentration.effect = DurationKind::SpiritGuardians;
    concentration.rounds_remaining = 100;
    for (Combatant* target : targets) {
        Duration d;
        d.kind = DurationKind::SpiritGuardians;
        d.source = &caster;
        d.slot = slot;
        encounter.resolver().apply_condition(*target, d);
        concentration.targets.push_back(target);
    }
    caster.concentration = std::move(concentration);
}

// ==============================================================================
// Wizard
// ==============================================================================

void cast_fire_bolt(Combatant& caster, Combatant& target, Encounter& encounter) {
    if (!begin_cast(caster, SpellId::FireBolt, 0, encounter)) return;

    const Weapon bolt = spell_attack("Fire Bolt", Dice(caster.cantrip_dice, 10), DamageType::Fire);
    encounter.resolver().weapon_attack(caster, target, bolt);
}

void cast_acid_splash(Combatant& caster, std::span<Combatant* const> targets, Encounter& encounter) {
    if (targets.empty() || !begin_cast(caster, SpellId::AcidSplash, 0, encounter)) return;

    const i32 damage = encounter.dice().roll(caster.cantrip_dice, 6);
    for (Combatant* target : targets) {
        if (target->is_hidden_from(caster)) continue;
        cantrip_save(caster, *target, Ability::Dex, damage, DamageType::Acid, "Acid Splash", encounter.resolver());
    }
}

void cast_poison_spray(Combatant& caster, Combatant& target, Encounter& encounter) {
    if (!begin_cast(caster, SpellId::PoisonSpray, 0, encounter)) return;
    if (target.is_hidden_from(caster)) return;

    const i32 damage = encounter.dice().roll(caster.cantrip_dice, 12);
    cantrip_save(caster, target, Ability::Con, damage, DamageType::Poison, "Poison Spray", encounter.resolver());
}

void cast_area_spell(Combatant& caster, SpellId id, u8 slot, std::span<Combatant* const> targets,
                     Encounter& encounter) {
    Dice dice;
    Ability save = Ability::Dex;
    switch (id) {
        case SpellId::BurningHands:  dice = Dice(static_cast<u8>(2 + slot), 6); break;
        case SpellId::Thunderwave:   dice = Dice(static_cast<u8>(1 + slot), 8); save = Ability::Con; break;
        case SpellId::Fireball:
        case SpellId::LightningBolt: dice = Dice(static_cast<u8>(5 + slot), 6); break;
        default: return;
    }

    if (targets.empty() || !begin_cast(caster, id, slot, encounter)) return;

    const Spell& spell = spell_info(id);
    const i32 damage = encounter.dice().roll(dice);
    for (Combatant* target : targets) {
        encounter.resolver().half_save_damage(caster, *target, save, caster.spell_save_dc(), damage,
                                              spell.damage_type, spell.name);
    }
}

void cast_chromatic_orb(Combatant& caster, u8 slot, Combatant& target, DamageType type,
                        Encounter& encounter) {
    if (!begin_cast(caster, SpellId::ChromaticOrb, slot, encounter)) return;

    const Weapon orb = spell_attack("Chromatic Orb", Dice(static_cast<u8>(2 + slot), 8), type);
    encounter.resolver().weapon_attack(caster, target, orb);
}

void cast_magic_missile(Combatant& caster, u8 slot, Encounter& encounter) {
    const TargetFilter filter = TargetFilter::foes().of_type(DamageType::Force).visible();
    if (!encounter.any_target(caster, filter)) return;
    if (!begin_cast(caster, SpellId::MagicMissile, slot, encounter)) return;

    // One roll for every dart
    const i32 damage = static_cast<i32>(encounter.dice().roll(4)) + 1;
    const auto darts = encounter.choose_targets(caster, slot + 2u, filter, true);
    for (Combatant* target : darts) {
        encounter.resolver().take_damage(*target, damage, DamageType::Force, &caster, "Magic Missile");
    }
}

void cast_acid_arrow(Combatant& caster, u8 slot, Combatant& target, Encounter& encounter) {
    if (!begin_cast(caster, SpellId::AcidArrow, slot, encounter)) return;

    ActionResolver& resolver = encounter.resolver();
    const Weapon arrow = spell_attack("Melf's Acid Arrow", Dice(static_cast<u8>(2 + slot), 4), DamageType::Acid);
    AttackResult result = resolver.roll_attack(caster, target, arrow);

    if (!result.hit()) {
        DamageRoll splash = resolver.roll_damage(caster, arrow, AttackOutcome::Hit);
        splash.primary /= 2;
        resolver.take_damage(target, splash, &caster, arrow.name.view());
        return;
    }

    resolver.take_damage(target, resolver.roll_damage(caster, arrow, result.outcome), &caster, arrow.name.view());

    if (target.is_conscious()) {
        Duration burn;
        burn.kind = DurationKind::AcidArrow;
        burn.source = &caster;
        burn.anchor = &target;
        burn.tick_at = TurnBoundary::EndOfTurn;
        burn.rounds_remaining = 1;
        burn.slot = slot;
        resolver.apply_condition(target, burn);
    }
}

void cast_scorching_ray(Combatant& caster, u8 slot, Encounter& encounter) {
    const TargetFilter filter = TargetFilter::foes().of_type(DamageType::Fire);
    if (!encounter.any_target(caster, filter)) return;
    if (!begin_cast(caster, SpellId::ScorchingRay, slot, encounter)) return;

    const Weapon ray = spell_attack("Scorching Ray", Dice(2, 6), DamageType::Fire);
    for (u8 i = 0; i < slot + 1; ++i) {
        Combatant* target = encounter.choose_target(caster, filter);
        if (target == nullptr) break;
        encounter.resolver().weapon_attack(caster, *target, ray);
    }
}

} // namespace d20
