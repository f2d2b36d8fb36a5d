#include "catalog/party.hpp"
#include "catalog/tactics.hpp"
#include "engine/encounter.hpp"
#include "engine/rest.hpp"
#include "engine/spells.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace d20 {

namespace {

// Alternatives a turn picks at most one of
constexpr u8 MAIN_DECISION = 1;

void raise(Combatant& c, Ability a) {
    ++c.abilities[static_cast<u8>(a)];
}

Combatant new_character(std::string_view name, u8 level, std::array<i8, ABILITY_COUNT> abilities, u8 hit_die) {
    Combatant c(name, Team::Party);
    c.level = level;
    c.abilities = abilities;
    c.proficiency = proficiency_for_level(level);
    c.hit_die = Dice(1, hit_die);
    c.hit_dice_total = level;
    return c;
}

// Hit points follow the final ability scores; the character then long rests
Combatant finish_character(Combatant c, DiceRoller& dice) {
    c.base_max_hp = character_max_hp(c.hit_die, c.level, c.modifier(Ability::Con));
    take_long_rest(c, dice);
    return c;
}

void set_full_caster_slots(Combatant& c) {
    const auto slots = full_caster_slots(c.level);
    for (u8 i = 0; i < MAX_SPELL_LEVEL; ++i) {
        c.spell_slots[i].maximum = slots[i];
        c.spell_slots[i].remaining = slots[i];
    }
}

void set_resource(Combatant& c, ResourceId id, u8 uses, RestKind interval) {
    c.resource(id).maximum = uses;
    c.resource(id).remaining = uses;
    c.ration(id).interval = interval;
}

void ration_resource(Combatant& c, ResourceId id, RationPolicy policy) {
    Ration& r = c.ration(id);
    r.enabled = true;
    r.policy = policy;
    r.budget = c.resource(id).maximum;
}

void note(Encounter& encounter, const Combatant& c, std::string_view what) {
    if (encounter.resolver().tracing()) {
        encounter.resolver().note(label(c) + " uses " + std::string(what));
    }
}

TargetFilter wounded_allies() {
    TargetFilter f = TargetFilter::allies();
    f.wounded_only = true;
    return f;
}

TargetFilter undead_foes() {
    TargetFilter f = TargetFilter::foes();
    f.undead_only = true;
    return f;
}

// ==============================================================================
// Cleric
// ==============================================================================

u32 downed_allies_without_aid(const Combatant& self, const Encounter& encounter) {
    u32 count = 0;
    for (const Combatant* c : encounter.allies_of(self)) {
        if (c->is_down() && !c->aided) ++count;
    }
    return count;
}

bool mass_healing_word_ready(const Combatant& self, const Encounter& encounter) {
    return self.lowest_slot_at_or_above(3).has_value()
        && encounter.count_targets(self, TargetFilter::downed_allies()) > 1;
}

void mass_healing_word(Combatant& self, Encounter& encounter) {
    const u8 slot = *self.lowest_slot_at_or_above(3);
    const auto targets = prioritized_targets(encounter.valid_targets(self, TargetFilter::downed_allies()),
                                             encounter.valid_targets(self, wounded_allies()),
                                             6, encounter.dice());
    cast_healing(self, SpellId::MassHealingWord, slot, targets, encounter);
}

bool aid_ready(const Combatant& self, const Encounter& encounter) {
    return self.lowest_slot_at_or_above(2).has_value() && downed_allies_without_aid(self, encounter) > 1;
}

void aid(Combatant& self, Encounter& encounter) {
    std::vector<Combatant*> downed;
    std::vector<Combatant*> standing;
    for (Combatant* c : encounter.allies_of(self)) {
        if (c->aided || c->is_destroyed()) continue;
        (c->is_down() ? downed : standing).push_back(c);
    }
    const auto targets = prioritized_targets(std::move(downed), std::move(standing), 3, encounter.dice());
    cast_aid(self, *self.lowest_slot_at_or_above(2), targets, encounter);
}

bool healing_word_ready(const Combatant& self, const Encounter& encounter) {
    return self.lowest_slot_at_or_above(1).has_value()
        && encounter.any_target(self, TargetFilter::downed_allies());
}

void healing_word(Combatant& self, Encounter& encounter) {
    Combatant* target = encounter.choose_target(self, TargetFilter::downed_allies());
    if (target == nullptr) return;
    cast_healing(self, SpellId::HealingWord, *self.lowest_slot_at_or_above(1), *target, encounter);
}

bool healing_word_self_ready(const Combatant& self, const Encounter&) {
    return self.hp <= self.max_hp / 4 && self.lowest_slot_at_or_above(1).has_value();
}

void healing_word_self(Combatant& self, Encounter& encounter) {
    cast_healing(self, SpellId::HealingWord, *self.lowest_slot_at_or_above(1), self, encounter);
}

bool turn_undead_ready(const Combatant& self, const Encounter& encounter) {
    return self.within_ration(ResourceId::ChannelDivinity)
        && encounter.count_targets(self, undead_foes()) > 1;
}

void turn_undead(Combatant& self, Encounter& encounter) {
    self.action = false;
    self.resource(ResourceId::ChannelDivinity).spend();
    note(encounter, self, "Turn Undead");

    ActionResolver& resolver = encounter.resolver();
    for (Combatant* target : encounter.choose_targets(self, 2, undead_foes())) {
        if (resolver.saving_throw(*target, Ability::Wis, self.spell_save_dc(), "Turn Undead")) continue;

        if (target->undead_cr <= self.destroy_undead_cr) {
            resolver.destroy(*target, &self, "Destroy Undead");
            continue;
        }

        Duration turned;
        turned.kind = DurationKind::Turned;
        turned.source = &self;
        turned.anchor = &self;
        turned.tick_at = TurnBoundary::StartOfTurn;
        turned.rounds_remaining = 10;
        resolver.apply_condition(*target, turned);
    }
}

bool spirit_guardians_ready(const Combatant& self, const Encounter& encounter) {
    return self.within_slot_ration()
        && self.lowest_slot_at_or_above(3).has_value()
        && !self.concentration
        && !any_foe_immune(self, encounter, DamageType::Radiant)
        && encounter.count_targets(self, TargetFilter::foes().without(DurationKind::SpiritGuardians)) > 1;
}

void spirit_guardians(Combatant& self, Encounter& encounter) {
    const auto targets = encounter.choose_targets(self, 2, TargetFilter::foes().without(DurationKind::SpiritGuardians));
    cast_spirit_guardians(self, *self.lowest_slot_at_or_above(3), targets, encounter);
}

bool spiritual_weapon_ready(const Combatant& self, const Encounter& encounter) {
    return self.within_slot_ration()
        && self.lowest_slot_at_or_above(2).has_value()
        && !self.has_condition(DurationKind::SpiritualWeapon)
        && !any_foe_immune(self, encounter, DamageType::Force);
}

void spiritual_weapon(Combatant& self, Encounter& encounter) {
    cast_spiritual_weapon(self, *self.lowest_slot_at_or_above(2), encounter);
}

bool bless_ready(const Combatant& self, const Encounter& encounter) {
    return self.within_slot_ration()
        && self.slot_count(1) > 0
        && !self.concentration
        && encounter.count_targets(self, TargetFilter::allies().without(DurationKind::Blessed)) >= 3;
}

void bless(Combatant& self, Encounter& encounter) {
    const auto targets = encounter.choose_targets(self, 3, TargetFilter::allies().without(DurationKind::Blessed));
    cast_bless(self, 1, targets, encounter);
}

bool guiding_bolt_ready(const Combatant& self, const Encounter& encounter) {
    return self.within_slot_ration()
        && self.lowest_slot_at_or_above(1).has_value()
        && !any_foe_immune(self, encounter, DamageType::Radiant)
        && any_conscious_foe(self, encounter);
}

void guiding_bolt(Combatant& self, Encounter& encounter) {
    Combatant* target = encounter.choose_target(self, TargetFilter::foes().of_type(DamageType::Radiant));
    if (target == nullptr) return;
    cast_guiding_bolt(self, *self.lowest_slot_at_or_above(1), *target, encounter);
}

bool spiritual_weapon_active(const Combatant& self, const Encounter&) {
    return self.has_condition(DurationKind::SpiritualWeapon);
}

// Mace or Sacred Flame with even odds; the mace when the flame cannot work
void mace_or_sacred_flame(Combatant& self, Encounter& encounter) {
    Combatant* target = encounter.choose_target(self);
    if (target == nullptr) {
        self.action = false;
        return;
    }

    if (any_foe_immune(self, encounter, DamageType::Radiant) || target->is_hidden_from(self)
        || encounter.dice().chance(0.5)) {
        self.action = false;
        encounter.resolver().weapon_attack(self, *target, self.weapons[0]);
    } else {
        cast_sacred_flame(self, *target, encounter);
    }
}

// Preserve Life: 5 x level hit points shared among allies at or below half
// their maximum, always topping up the lowest first
void preserve_life(Combatant& self, Encounter& encounter) {
    self.resource(ResourceId::ChannelDivinity).spend();
    note(encounter, self, "Preserve Life");

    std::vector<std::pair<Combatant*, i32>> wounded;
    for (Combatant* c : encounter.allies_of(self)) {
        if (!c->is_destroyed() && c->hp <= c->max_hp / 2) wounded.emplace_back(c, 0);
    }

    i32 pool = 5 * self.level;
    while (pool > 0) {
        auto lowest = wounded.end();
        for (auto it = wounded.begin(); it != wounded.end(); ++it) {
            const i32 current = it->first->hp + it->second;
            if (current >= it->first->max_hp / 2) continue;
            if (lowest == wounded.end() || current < lowest->first->hp + lowest->second) lowest = it;
        }
        if (lowest == wounded.end()) break;
        ++lowest->second;
        --pool;
    }

    for (const auto& [ally, amount] : wounded) {
        if (amount > 0) encounter.resolver().heal(self, *ally, amount, "Preserve Life");
    }
}

void cleric_end_encounter(Combatant& self, Encounter& encounter) {
    if (self.within_ration(ResourceId::ChannelDivinity)) preserve_life(self, encounter);

    std::vector<Combatant*> downed = encounter.valid_targets(self, TargetFilter::downed_allies());
    if (downed.empty()) return;

    if (self.spell_slots_remaining() >= downed.size()) {
        for (Combatant* ally : downed) {
            const auto slot = self.lowest_slot_at_or_above(1);
            if (!slot) break;
            cast_healing(self, SpellId::CureWounds, *slot, *ally, encounter);
        }
    } else if (const auto slot = self.lowest_slot_at_or_above(2)) {
        const auto targets = prioritized_targets(std::move(downed), encounter.valid_targets(self, wounded_allies()),
                                                 6, encounter.dice());
        cast_healing(self, SpellId::PrayerOfHealing, *slot, targets, encounter);
    } else if (self.slot_count(1) > 0) {
        for (Combatant* ally : sample(std::move(downed), self.slot_count(1), encounter.dice())) {
            cast_healing(self, SpellId::CureWounds, 1, *ally, encounter);
        }
    }
}

// Death Ward is cast at the start of the day with a 4th-level slot
void cleric_long_rest(Combatant& self, DiceRoller&) {
    if (self.level >= 7 && self.spend_slot(4)) self.death_ward = true;
}

const std::array<ActionOption, 11> CLERIC_OPTIONS = {{
    {"Mass Healing Word", TurnSlot::BonusAction, mass_healing_word_ready, mass_healing_word, MAIN_DECISION},
    {"Aid",               TurnSlot::Action,      aid_ready,               aid,               MAIN_DECISION},
    {"Healing Word",      TurnSlot::BonusAction, healing_word_ready,      healing_word,      MAIN_DECISION},
    {"Healing Word self", TurnSlot::BonusAction, healing_word_self_ready, healing_word_self, MAIN_DECISION},
    {"Turn Undead",       TurnSlot::Action,      turn_undead_ready,       turn_undead,       MAIN_DECISION},
    {"Spirit Guardians",  TurnSlot::Action,      spirit_guardians_ready,  spirit_guardians,  MAIN_DECISION},
    {"Spiritual Weapon",  TurnSlot::BonusAction, spiritual_weapon_ready,  spiritual_weapon,  MAIN_DECISION},
    {"Bless",             TurnSlot::Action,      bless_ready,             bless,             MAIN_DECISION},
    {"Guiding Bolt",      TurnSlot::Action,      guiding_bolt_ready,      guiding_bolt,      MAIN_DECISION},
    {"Spiritual Weapon attack", TurnSlot::BonusAction, spiritual_weapon_active, spiritual_weapon_attack, 0},
    {"Mace or Sacred Flame",    TurnSlot::Action,      nullptr,                 mace_or_sacred_flame,    0},
}};

// ==============================================================================
// Fighter
// ==============================================================================

bool second_wind_ready(const Combatant& self, const Encounter&) {
    const i32 threshold = self.max_hp - std::min<i32>(self.max_hp / 2, self.hit_die.sides + self.level);
    return self.resource(ResourceId::SecondWind).available() && self.hp <= threshold;
}

i32 second_wind_roll(const Combatant& self, DiceRoller& dice) {
    return static_cast<i32>(dice.roll(10)) + self.level;
}

void second_wind(Combatant& self, Encounter& encounter) {
    self.bonus_action = false;
    self.resource(ResourceId::SecondWind).spend();
    encounter.resolver().heal(self, self, second_wind_roll(self, encounter.dice()), "Second Wind");
}

void fighter_attacks(Combatant& self, Encounter& encounter) {
    for (u8 i = 0; i < self.attacks_per_action; ++i) {
        if (!self.is_conscious()) break;
        Combatant* target = encounter.choose_target(self);
        if (target == nullptr) break;
        encounter.resolver().weapon_attack(self, *target, self.weapons[0]);
    }
}

void fighter_attack_action(Combatant& self, Encounter& encounter) {
    self.action = false;
    fighter_attacks(self, encounter);
}

bool action_surge_ready(const Combatant& self, const Encounter& encounter) {
    return self.within_ration(ResourceId::ActionSurge) && any_conscious_foe(self, encounter);
}

void action_surge(Combatant& self, Encounter& encounter) {
    self.resource(ResourceId::ActionSurge).spend();
    note(encounter, self, "Action Surge");
    fighter_attacks(self, encounter);
}

// Second Wind is spent before it recharges
void fighter_short_rest(Combatant& self, DiceRoller& dice) {
    ResourcePool& wind = self.resource(ResourceId::SecondWind);
    if (self.is_conscious() && self.is_wounded() && wind.spend()) {
        self.hp = std::min(self.max_hp, self.hp + second_wind_roll(self, dice));
    }
}

const std::array<ActionOption, 3> FIGHTER_OPTIONS = {{
    {"Second Wind",  TurnSlot::BonusAction, second_wind_ready,  second_wind,           0},
    {"Greatsword",   TurnSlot::Action,      nullptr,            fighter_attack_action, 0},
    {"Action Surge", TurnSlot::Free,        action_surge_ready, action_surge,          0},
}};

// ==============================================================================
// Rogue
// ==============================================================================

u8 sneak_attack_dice(const Combatant& self) {
    return static_cast<u8>((self.level + 1) / 2);
}

u32 active_allies(const Combatant& self, const Encounter& encounter) {
    u32 count = 0;
    for (const Combatant* c : encounter.allies_of(self)) {
        if (c->is_conscious() && !c->is_incapacitated()) ++count;
    }
    return count;
}

// One rapier attack, preferring foes that have not acted yet
void rogue_strike(Combatant& self, Encounter& encounter, const Weapon& weapon) {
    std::vector<Combatant*> surprised;
    for (Combatant* c : encounter.foes_of(self)) {
        if (c->is_conscious() && c->surprised) surprised.push_back(c);
    }

    Combatant* target = surprised.empty()
        ? encounter.choose_target(self)
        : surprised[encounter.dice().pick_index(static_cast<u32>(surprised.size()))];
    if (target == nullptr) return;

    ActionResolver& resolver = encounter.resolver();

    if (self.features.assassinate && target->surprised) {
        const Weapon w = self.sneak_attack_available ? weapon.with_extra_dice(sneak_attack_dice(self), 6) : weapon;
        AttackOptions options;
        options.advantage = true;
        options.crit_on_hit = true;
        if (resolver.weapon_attack(self, *target, w, options).hit()) self.sneak_attack_available = false;
        return;
    }

    const bool sneak = self.sneak_attack_available
        && (resolver.attack_advantage(self, *target, true)
            || (active_allies(self, encounter) > 1 && !resolver.attack_disadvantage(self, *target)));
    const Weapon w = sneak ? weapon.with_extra_dice(sneak_attack_dice(self), 6) : weapon;

    if (resolver.weapon_attack(self, *target, w).hit()) self.sneak_attack_available = false;
}

void rapier(Combatant& self, Encounter& encounter) {
    self.action = false;
    rogue_strike(self, encounter, self.weapons[0]);
}

// The off-hand rapier only follows a turn that has not landed Sneak Attack
bool offhand_ready(const Combatant& self, const Encounter& encounter) {
    return self.weapons.size() > 1 && !self.action && self.sneak_attack_available
        && any_conscious_foe(self, encounter);
}

void offhand_rapier(Combatant& self, Encounter& encounter) {
    self.bonus_action = false;
    rogue_strike(self, encounter, self.weapons[1]);
}

bool cunning_action_ready(const Combatant& self, const Encounter&) {
    return self.features.cunning_action;
}

const std::array<ActionOption, 3> ROGUE_OPTIONS = {{
    {"Rapier",          TurnSlot::Action,      nullptr,              rapier,         0},
    {"Off-hand Rapier", TurnSlot::BonusAction, offhand_ready,        offhand_rapier, 0},
    {"Hide",            TurnSlot::BonusAction, cunning_action_ready, hide,           0},
}};

// ==============================================================================
// Wizard
// ==============================================================================

struct FoeImmunities {
    bool acid = false;
    bool cold = false;
    bool fire = false;
    bool force = false;
    bool lightning = false;
    bool poison = false;
    bool thunder = false;
};

FoeImmunities foe_immunities(const Combatant& self, const Encounter& encounter) {
    FoeImmunities imm;
    for (const Combatant* c : encounter.foes_of(self)) {
        if (!c->is_conscious()) continue;
        imm.acid      |= c->immune_to(DamageType::Acid);
        imm.cold      |= c->immune_to(DamageType::Cold);
        imm.fire      |= c->immune_to(DamageType::Fire);
        imm.force     |= c->immune_to(DamageType::Force);
        imm.lightning |= c->immune_to(DamageType::Lightning);
        imm.poison    |= c->immune_to(DamageType::Poison);
        imm.thunder   |= c->immune_to(DamageType::Thunder);
    }
    return imm;
}

void area_spell(Combatant& self, SpellId id, u8 slot, Encounter& encounter) {
    const auto targets = encounter.choose_targets(self, 2, TargetFilter::foes().of_type(spell_info(id).damage_type));
    cast_area_spell(self, id, slot, targets, encounter);
}

void first_level_spell(Combatant& self, u8 slot, u32 foes, u32 visible, const FoeImmunities& imm,
                       Encounter& encounter) {
    const f64 choice = encounter.dice().uniform();

    if (foes == 1 && visible > 0) {
        const DamageType type = imm.cold ? DamageType::Thunder : DamageType::Cold;
        Combatant* target = encounter.choose_target(self, TargetFilter::foes().visible().of_type(type));
        if (target != nullptr) cast_chromatic_orb(self, slot, *target, type, encounter);
    } else if (imm.fire) {
        if (imm.thunder || (!imm.force && visible > 0 && choice < 0.5)) {
            cast_magic_missile(self, slot, encounter);
        } else {
            area_spell(self, SpellId::Thunderwave, slot, encounter);
        }
    } else if (imm.thunder) {
        if (imm.force || visible == 0 || choice < 0.5) {
            area_spell(self, SpellId::BurningHands, slot, encounter);
        } else {
            cast_magic_missile(self, slot, encounter);
        }
    } else if (imm.force || visible == 0) {
        area_spell(self, choice < 0.5 ? SpellId::BurningHands : SpellId::Thunderwave, slot, encounter);
    } else if (choice < 1.0 / 3) {
        area_spell(self, SpellId::BurningHands, slot, encounter);
    } else if (choice < 2.0 / 3) {
        cast_magic_missile(self, slot, encounter);
    } else {
        area_spell(self, SpellId::Thunderwave, slot, encounter);
    }
}

bool leveled_spell_ready(const Combatant& self, const Encounter& encounter) {
    return self.within_slot_ration() && any_conscious_foe(self, encounter);
}

// Highest spell tier first; a tier the foes are immune to is skipped. Leaves
// the action unspent when nothing could be cast.
void leveled_spell(Combatant& self, Encounter& encounter) {
    const u32 foes = encounter.count_targets(self, TargetFilter::foes());
    const u32 visible = encounter.count_targets(self, TargetFilter::foes().visible());
    const FoeImmunities imm = foe_immunities(self, encounter);
    DiceRoller& dice = encounter.dice();

    if (const auto slot = self.lowest_slot_at_or_above(3); slot && foes > 1 && !(imm.fire && imm.lightning)) {
        const bool fireball = imm.lightning || (!imm.fire && dice.chance(0.5));
        area_spell(self, fireball ? SpellId::Fireball : SpellId::LightningBolt, *slot, encounter);
    } else if (const auto slot2 = self.lowest_slot_at_or_above(2); slot2 && !(imm.fire && imm.acid)) {
        if (imm.fire || (!imm.acid && dice.chance(0.5))) {
            Combatant* target = encounter.choose_target(self, TargetFilter::foes().of_type(DamageType::Acid));
            if (target != nullptr) cast_acid_arrow(self, *slot2, *target, encounter);
        } else {
            cast_scorching_ray(self, *slot2, encounter);
        }
    } else if (const auto slot1 = self.lowest_slot_at_or_above(1)) {
        first_level_spell(self, *slot1, foes, visible, imm, encounter);
    }
}

void cantrip(Combatant& self, Encounter& encounter) {
    const FoeImmunities imm = foe_immunities(self, encounter);
    const f64 choice = encounter.dice().uniform();

    const auto fire_bolt = [&] {
        Combatant* target = encounter.choose_target(self, TargetFilter::foes().of_type(DamageType::Fire));
        if (target != nullptr) cast_fire_bolt(self, *target, encounter);
    };
    const auto acid_splash = [&] {
        const auto targets = encounter.choose_targets(self, 2, TargetFilter::foes().visible().of_type(DamageType::Acid));
        cast_acid_splash(self, targets, encounter);
    };
    const auto poison_spray = [&] {
        Combatant* target = encounter.choose_target(self, TargetFilter::foes().visible().of_type(DamageType::Poison));
        if (target != nullptr) cast_poison_spray(self, *target, encounter);
    };

    if (!encounter.any_target(self, TargetFilter::foes().visible())) {
        fire_bolt();
    } else if (imm.poison) {
        if (imm.fire || (!imm.acid && choice < 0.5)) acid_splash();
        else fire_bolt();
    } else if (imm.fire) {
        if (!imm.acid && choice < 0.5) acid_splash();
        else poison_spray();
    } else if (imm.acid) {
        if (choice < 0.5) fire_bolt();
        else poison_spray();
    } else if (choice < 1.0 / 3) {
        acid_splash();
    } else if (choice < 2.0 / 3) {
        fire_bolt();
    } else {
        poison_spray();
    }

    self.action = false;
}

// Arcane Recovery on the first short rest: (level + 1) / 2 slot levels,
// highest slots first
void wizard_short_rest(Combatant& self, DiceRoller&) {
    if (!self.is_conscious() || !self.resource(ResourceId::ArcaneRecovery).spend()) return;

    u8 budget = static_cast<u8>((self.level + 1) / 2);
    for (u8 slot = 6; slot >= 1; --slot) {
        ResourcePool& pool = self.spell_slots[slot - 1];
        while (pool.remaining < pool.maximum && budget >= slot) {
            ++pool.remaining;
            budget = static_cast<u8>(budget - slot);
        }
    }
}

// Mage Armor is cast at the start of the day with a 1st-level slot
void wizard_long_rest(Combatant& self, DiceRoller&) {
    self.spend_slot(1);
}

const std::array<ActionOption, 2> WIZARD_OPTIONS = {{
    {"Leveled spell", TurnSlot::Action, leveled_spell_ready, leveled_spell, 0},
    {"Cantrip",       TurnSlot::Action, nullptr,             cantrip,       0},
}};

} // namespace

std::array<u8, MAX_SPELL_LEVEL> full_caster_slots(u8 level) {
    static constexpr std::array<std::array<u8, MAX_SPELL_LEVEL>, MAX_PARTY_LEVEL> TABLE = {{
        {2, 0, 0, 0, 0, 0, 0, 0, 0},
        {3, 0, 0, 0, 0, 0, 0, 0, 0},
        {4, 2, 0, 0, 0, 0, 0, 0, 0},
        {4, 3, 0, 0, 0, 0, 0, 0, 0},
        {4, 3, 2, 0, 0, 0, 0, 0, 0},
        {4, 3, 3, 0, 0, 0, 0, 0, 0},
        {4, 3, 3, 1, 0, 0, 0, 0, 0},
        {4, 3, 3, 2, 0, 0, 0, 0, 0},
    }};
    const u8 row = std::clamp<u8>(level, MIN_PARTY_LEVEL, MAX_PARTY_LEVEL);
    return TABLE[row - 1];
}

// ==============================================================================
// Factories
// ==============================================================================

Combatant make_cleric(const CombatantParams& params, DiceRoller& dice) {
    const u8 level = params.level;
    Combatant c = new_character("Cleric", level, {2, -1, 2, 0, 3, 1}, 8);
    if (level >= 4) raise(c, Ability::Str);
    if (level >= 8) raise(c, Ability::Wis);

    c.armor_type = ArmorType::Heavy;
    c.base_armor_class = level >= 5 ? 20 : 18;
    c.save_proficiencies = ability_bit(Ability::Wis) | ability_bit(Ability::Cha);
    c.spell_ability = Ability::Wis;
    c.cantrip_dice = cantrip_dice_for_level(level);

    c.features.war_caster = true;
    c.features.disciple_of_life = true;
    c.features.blessed_healer = level >= 6;

    Weapon mace("Mace", Dice(1, 6), DamageType::Bludgeoning);
    if (level >= 6) mace = mace.with_magic_bonus(1);
    if (level >= 8) {
        mace.secondary_dice = Dice(1, 8);
        mace.secondary_type = DamageType::Radiant;
    }
    c.weapons.push_back(mace);

    set_full_caster_slots(c);
    c.slot_ration.enabled = true;
    c.slot_ration.policy = RationPolicy::BackLoaded;
    c.slot_ration.interval = RestKind::Long;
    c.slot_ration.budget = static_cast<u8>(c.spell_slots_total() - (level >= 7 ? 1 : 0));

    set_resource(c, ResourceId::ChannelDivinity, level >= 6 ? 2 : level >= 2 ? 1 : 0, RestKind::Short);
    ration_resource(c, ResourceId::ChannelDivinity, RationPolicy::BackLoaded);
    if (level >= 8) {
        c.destroy_undead_cr = 1.0f;
    } else if (level >= 5) {
        c.destroy_undead_cr = 0.5f;
    }

    c.behavior = Behavior{Archetype::Cleric, CLERIC_OPTIONS, nullptr, cleric_end_encounter, nullptr, cleric_long_rest};
    return finish_character(std::move(c), dice);
}

Combatant make_fighter(const CombatantParams& params, DiceRoller& dice) {
    const u8 level = params.level;
    Combatant c = new_character("Fighter", level, {3, 1, 3, -1, 1, 0}, 10);
    if (level >= 4) raise(c, Ability::Str);
    if (level >= 6) raise(c, Ability::Con);
    if (level >= 8) raise(c, Ability::Str);

    c.armor_type = ArmorType::Heavy;
    c.base_armor_class = level >= 5 ? 18 : level >= 3 ? 17 : 16;
    c.resistances = damage_bit(DamageType::Poison);
    c.save_proficiencies = ability_bit(Ability::Str) | ability_bit(Ability::Con);
    c.skill_proficiencies = skill_bit(Skill::Perception);
    c.crit_threshold = level >= 3 ? 19 : 20;
    c.attacks_per_action = level >= 5 ? 2 : 1;
    c.features.heavy_armor_master = level >= 4;

    Weapon greatsword("Greatsword", Dice(2, 6, 2), DamageType::Slashing);
    if (level >= 6) greatsword = greatsword.with_magic_bonus(1);
    c.weapons.push_back(greatsword);

    set_resource(c, ResourceId::SecondWind, 1, RestKind::Short);
    set_resource(c, ResourceId::ActionSurge, level >= 2 ? 1 : 0, RestKind::Short);
    ration_resource(c, ResourceId::ActionSurge, RationPolicy::FrontLoaded);

    c.behavior = Behavior{Archetype::Fighter, FIGHTER_OPTIONS, nullptr, nullptr, fighter_short_rest, nullptr};
    return finish_character(std::move(c), dice);
}

Combatant make_rogue(const CombatantParams& params, DiceRoller& dice) {
    const u8 level = params.level;
    Combatant c = new_character("Rogue", level, {-1, 3, 2, 1, 2, 0}, 8);
    if (level >= 8) raise(c, Ability::Dex);

    c.armor_type = ArmorType::Light;
    c.base_armor_class = level >= 4 ? 13 : level >= 2 ? 12 : 11;
    c.save_proficiencies = ability_bit(Ability::Dex) | ability_bit(Ability::Int);
    c.skill_proficiencies = skill_bit(Skill::Perception) | skill_bit(Skill::Stealth);
    c.skill_expertise = skill_bit(Skill::Stealth);
    if (level >= 6) c.skill_expertise |= skill_bit(Skill::Perception);

    c.features.sneak_attack = true;
    c.features.paralysis_immune = true;
    c.features.cunning_action = level >= 2;
    c.features.assassinate = level >= 3;
    c.features.uncanny_dodge = level >= 5;
    c.features.evasion = level >= 7;

    Weapon rapier_weapon("Rapier", Dice(1, 8), DamageType::Piercing, Ability::Dex);
    c.weapons.push_back(level >= 6 ? rapier_weapon.with_magic_bonus(1) : rapier_weapon);
    if (level >= 4) {
        Weapon offhand("Off-hand Rapier", Dice(1, 8), DamageType::Piercing, Ability::Dex);
        offhand.add_ability = false;
        c.weapons.push_back(offhand);
    }

    c.behavior = Behavior{Archetype::Rogue, ROGUE_OPTIONS, nullptr, nullptr, nullptr, nullptr};
    return finish_character(std::move(c), dice);
}

Combatant make_wizard(const CombatantParams& params, DiceRoller& dice) {
    const u8 level = params.level;
    Combatant c = new_character("Wizard", level, {-1, 2, 2, 3, 1, 0}, 6);
    if (level >= 4) raise(c, Ability::Int);
    if (level >= 8) raise(c, Ability::Int);

    // Mage Armor
    c.armor_type = ArmorType::None;
    c.base_armor_class = 13;
    c.save_proficiencies = ability_bit(Ability::Int) | ability_bit(Ability::Wis);
    c.spell_ability = Ability::Int;
    c.cantrip_dice = cantrip_dice_for_level(level);
    c.features.potent_cantrip = level >= 6;
    c.spell_attack_extra = level >= 6 ? 1 : 0;

    c.weapons.emplace_back("Quarterstaff", Dice(1, 6), DamageType::Bludgeoning);

    set_full_caster_slots(c);
    c.slot_ration.enabled = true;
    c.slot_ration.policy = RationPolicy::FrontLoaded;
    c.slot_ration.interval = RestKind::Long;
    c.slot_ration.budget = static_cast<u8>(c.spell_slots_total() - 1);

    set_resource(c, ResourceId::ArcaneRecovery, 1, RestKind::Long);

    c.behavior = Behavior{Archetype::Wizard, WIZARD_OPTIONS, nullptr, nullptr, wizard_short_rest, wizard_long_rest};
    return finish_character(std::move(c), dice);
}

void register_party(CombatantRegistry& registry) {
    registry.register_entry("Cleric", Team::Party, make_cleric);
    registry.register_entry("Fighter", Team::Party, make_fighter);
    registry.register_entry("Rogue", Team::Party, make_rogue);
    registry.register_entry("Wizard", Team::Party, make_wizard);
}

} // namespace d20
