#include "engine/resolver.hpp"
#include <algorithm>
#include <cassert>
#include <vector>

namespace d20 {

// ==============================================================================
// Attacks
// ==============================================================================

bool ActionResolver::attack_advantage(Combatant& attacker, Combatant& target, bool read_only) {
    bool advantage = false;

    if (Duration* mark = target.find_condition(DurationKind::GuidingBolt)) {
        advantage = true;
        if (!read_only) target.remove_condition(mark->id);
    }
    if (target.is_incapacitated()) advantage = true;
    if (target.prone) advantage = true;
    if (attacker.is_hidden_from(target)) advantage = true;

    return advantage;
}

bool ActionResolver::attack_disadvantage(const Combatant& attacker, const Combatant& target) const {
    return attacker.prone || target.is_hidden_from(attacker);
}

i32 ActionResolver::attack_bonus(const Combatant& attacker, const Weapon& weapon) const {
    if (weapon.is_spell) {
        return attacker.spell_attack_bonus() + weapon.attack_modifier;
    }
    i32 bonus = attacker.modifier(weapon.ability) + weapon.attack_modifier;
    if (weapon.proficient) bonus += attacker.proficiency;
    return bonus;
}

i32 ActionResolver::bless_bonus(const Combatant& c) {
    return c.has_condition(DurationKind::Blessed) ? static_cast<i32>(dice_.roll(4)) : 0;
}

AttackResult ActionResolver::roll_attack(Combatant& attacker, Combatant& target, const Weapon& weapon,
                                         const AttackOptions& options) {
    const bool advantage = attack_advantage(attacker, target, false) || options.advantage;
    const bool disadvantage = attack_disadvantage(attacker, target) || options.disadvantage;

    AttackResult result;
    result.natural = dice_.roll_d20(advantage, disadvantage);
    result.total = static_cast<i32>(result.natural) + attack_bonus(attacker, weapon) + bless_bonus(attacker);

    if (result.natural >= attacker.crit_threshold) {
        result.outcome = AttackOutcome::Crit;
    } else if (result.natural > 1 && result.total >= target.armor_class()) {
        result.outcome = AttackOutcome::Hit;
    }

    // Hits against a helpless or unaware target land as critical hits
    if (result.outcome == AttackOutcome::Hit && (target.is_incapacitated() || options.crit_on_hit)) {
        result.outcome = AttackOutcome::Crit;
    }

    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Attack;
        e.actor = label(attacker);
        e.action = std::string(weapon.name.view());
        e.target = label(target);
        e.natural_roll = static_cast<i32>(result.natural);
        e.total_roll = result.total;
        e.target_number = target.armor_class();
        e.detail = std::string(to_string(result.outcome));
        if (advantage && !disadvantage) e.detail += ", advantage";
        if (disadvantage && !advantage) e.detail += ", disadvantage";
        record(std::move(e));
    }

    return result;
}

DamageRoll ActionResolver::roll_damage(const Combatant& attacker, const Weapon& weapon, AttackOutcome outcome) {
    DamageRoll roll;
    roll.primary_type = weapon.damage_type;
    roll.secondary_type = weapon.secondary_type;
    if (outcome == AttackOutcome::Miss) return roll;

    const u8 multiplier = outcome == AttackOutcome::Crit ? 2 : 1;
    roll.primary = dice_.roll(weapon.dice.times(multiplier)) + weapon.damage_modifier;
    if (weapon.add_ability) roll.primary += attacker.modifier(weapon.ability);
    roll.primary = std::max(0, roll.primary);

    if (weapon.has_secondary()) {
        roll.secondary = dice_.roll(weapon.secondary_dice.times(multiplier));
    }
    return roll;
}

AttackResult ActionResolver::weapon_attack(Combatant& attacker, Combatant& target, const Weapon& weapon,
                                           const AttackOptions& options) {
    AttackResult result = roll_attack(attacker, target, weapon, options);

    // Attacking gives away a hidden position
    attacker.stealth = 0;

    if (!result.hit()) return result;

    DamageRoll damage = roll_damage(attacker, weapon, result.outcome);

    if (options.allow_reaction && target.features.uncanny_dodge && target.reaction
        && target.is_conscious() && !target.is_incapacitated() && !attacker.is_hidden_from(target)) {
        target.reaction = false;
        damage.primary /= 2;
        damage.secondary /= 2;
        if (tracing()) {
            TraceEvent e;
            e.kind = TraceKind::Condition;
            e.target = label(target);
            e.action = "uses Uncanny Dodge";
            record(std::move(e));
        }
    }

    result.damage_dealt = take_damage(target, damage, &attacker, weapon.name.view());

    if (weapon.has_rider()) apply_rider(attacker, target, weapon);

    return result;
}

void ActionResolver::apply_rider(Combatant& attacker, Combatant& target, const Weapon& weapon) {
    if (!target.is_conscious()) return;

    switch (weapon.on_hit) {
        case OnHitEffect::Prone:
            if (!target.prone && !saving_throw(target, weapon.on_hit_save, weapon.on_hit_dc, "knockdown")) {
                knock_prone(target, &attacker);
            }
            break;
        case OnHitEffect::Paralyze:
            if (target.features.paralysis_immune || target.is_undead() || target.construct) break;
            if (target.find_condition(DurationKind::Paralyzed, &attacker) != nullptr) break;
            if (!saving_throw(target, weapon.on_hit_save, weapon.on_hit_dc, "paralysis")) {
                paralyze(target, attacker, weapon.on_hit_dc);
            }
            break;
        case OnHitEffect::None:
            break;
    }
}

// ==============================================================================
// Damage
// ==============================================================================

i32 ActionResolver::adjusted_damage(const Combatant& target, i32 amount, DamageType type) const {
    if (amount <= 0) return 0;

    if (target.features.heavy_armor_master
        && (type == DamageType::Bludgeoning || type == DamageType::Piercing || type == DamageType::Slashing)) {
        amount = std::max(0, amount - 3);
    }
    if (target.resists(type)) amount /= 2;
    if (target.vulnerable_to(type)) amount *= 2;
    if (target.immune_to(type)) amount = 0;

    return amount;
}

i32 ActionResolver::take_damage(Combatant& target, i32 amount, DamageType type, Combatant* source,
                                std::string_view action) {
    DamageRoll roll;
    roll.primary = amount;
    roll.primary_type = type;
    return take_damage(target, roll, source, action);
}

i32 ActionResolver::take_damage(Combatant& target, const DamageRoll& roll, Combatant* source,
                                std::string_view action) {
    if (target.is_destroyed()) return 0;

    const i32 before = target.hp;
    const i32 amount = adjusted_damage(target, roll.primary, roll.primary_type)
                     + adjusted_damage(target, roll.secondary, roll.secondary_type);

    target.hp = std::max(0, target.hp - amount);

    if (tracing() && amount > 0) {
        TraceEvent e;
        e.kind = TraceKind::Damage;
        e.actor = source != nullptr ? label(*source) : std::string("effect");
        e.action = std::string(action);
        e.target = label(target);
        e.hp_before = before;
        e.hp_after = target.hp;
        e.detail = std::string(to_string(roll.primary_type));
        if (roll.secondary > 0) e.detail += " + " + std::string(to_string(roll.secondary_type));
        record(std::move(e));
    }

    if (target.hp == 0 && before > 0) {
        const bool radiant = roll.primary_type == DamageType::Radiant
                          || (roll.secondary > 0 && roll.secondary_type == DamageType::Radiant);
        fall_unconscious(target, amount, radiant ? DamageType::Radiant : roll.primary_type);
    } else if (amount > 0 && target.concentration) {
        concentration_check(target, amount);
    }

    if (amount > 0 && target.is_turned()) {
        target.remove_conditions(DurationKind::Turned);
        if (tracing()) {
            TraceEvent e;
            e.kind = TraceKind::Condition;
            e.target = label(target);
            e.action = "is no longer turned";
            record(std::move(e));
        }
    }

    assert(target.hp >= 0 && target.hp <= target.max_hp);
    return before - target.hp;
}

void ActionResolver::destroy(Combatant& target, Combatant* source, std::string_view action) {
    if (target.is_destroyed()) return;

    const i32 before = target.hp;
    target.hp = 0;
    target.max_hp = 0;
    target.prone = true;
    target.end_concentration();

    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Condition;
        e.actor = source != nullptr ? label(*source) : std::string("effect");
        e.action = "is destroyed by " + std::string(action);
        e.target = label(target);
        e.hp_before = before;
        record(std::move(e));
    }
}

void ActionResolver::fall_unconscious(Combatant& target, i32 damage, DamageType type) {
    if (target.features.undead_fortitude && type != DamageType::Radiant
        && saving_throw(target, Ability::Con, 5 + damage, "Undead Fortitude")) {
        target.hp = 1;
        if (tracing()) note(label(target) + " stays up with Undead Fortitude");
        return;
    }

    if (target.death_ward) {
        target.death_ward = false;
        target.hp = 1;
        if (tracing()) note(label(target) + " is saved by Death Ward");
        return;
    }

    target.prone = true;
    target.end_concentration();
    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Condition;
        e.target = label(target);
        e.action = target.team == Team::Party ? "falls unconscious" : "is defeated";
        record(std::move(e));
    }
}

void ActionResolver::concentration_check(Combatant& target, i32 damage) {
    const i32 dc = std::max(10, damage / 2);
    if (!saving_throw(target, Ability::Con, dc, "concentration", target.features.war_caster)) {
        target.end_concentration();
        if (tracing()) {
            TraceEvent e;
            e.kind = TraceKind::Condition;
            e.target = label(target);
            e.action = "loses concentration";
            record(std::move(e));
        }
    }
}

// ==============================================================================
// Saving Throws
// ==============================================================================

bool ActionResolver::saving_throw(Combatant& target, Ability ability, i32 dc, std::string_view action,
                                  bool advantage, bool disadvantage) {
    if (target.is_incapacitated() && (ability == Ability::Str || ability == Ability::Dex)) {
        if (tracing()) {
            TraceEvent e;
            e.kind = TraceKind::Save;
            e.target = label(target);
            e.action = std::string(action);
            e.target_number = dc;
            e.detail = "automatic failure";
            record(std::move(e));
        }
        return false;
    }

    const u32 natural = dice_.roll_d20(advantage, disadvantage);
    i32 total = static_cast<i32>(natural) + target.modifier(ability) + bless_bonus(target);
    if (target.proficient_save(ability)) total += target.proficiency;

    const bool success = total >= dc;

    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Save;
        e.target = label(target);
        e.action = std::string(to_string(ability)) + " " + std::string(action);
        e.natural_roll = static_cast<i32>(natural);
        e.total_roll = total;
        e.target_number = dc;
        e.detail = success ? "success" : "failure";
        record(std::move(e));
    }

    return success;
}

i32 ActionResolver::half_save_damage(Combatant& caster, Combatant& target, Ability ability, i32 dc,
                                     i32 damage, DamageType type, std::string_view action) {
    const bool saved = saving_throw(target, ability, dc, action);

    i32 amount = 0;
    if (target.features.evasion && ability == Ability::Dex && !target.is_incapacitated()) {
        amount = saved ? 0 : damage / 2;
    } else {
        amount = saved ? damage / 2 : damage;
    }

    if (amount <= 0) return 0;
    return take_damage(target, amount, type, &caster, action);
}

i32 ActionResolver::save_or_damage(Combatant& caster, Combatant& target, Ability ability, i32 dc,
                                   i32 damage, DamageType type, std::string_view action) {
    if (saving_throw(target, ability, dc, action)) return 0;
    return take_damage(target, damage, type, &caster, action);
}

// ==============================================================================
// Healing
// ==============================================================================

i32 ActionResolver::heal(Combatant& healer, Combatant& target, i32 amount, std::string_view action) {
    if (target.is_destroyed() || amount <= 0) return 0;

    const i32 before = target.hp;
    target.hp = std::min(target.max_hp, target.hp + amount);

    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Healing;
        e.actor = label(healer);
        e.action = std::string(action);
        e.target = label(target);
        e.hp_before = before;
        e.hp_after = target.hp;
        if (before == 0 && target.hp > 0) e.detail = "revived";
        record(std::move(e));
    }

    assert(target.hp >= 0 && target.hp <= target.max_hp);
    return target.hp - before;
}

// ==============================================================================
// Conditions
// ==============================================================================

u32 ActionResolver::apply_condition(Combatant& bearer, Duration duration) {
    const u32 id = bearer.add_condition(duration);
    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Condition;
        e.target = label(bearer);
        e.action = "gains " + std::string(to_string(duration.kind));
        if (duration.source != nullptr && duration.source != &bearer) e.actor = label(*duration.source);
        record(std::move(e));
    }
    return id;
}

void ActionResolver::end_condition(Combatant& bearer, u32 id) {
    Duration* d = bearer.find_condition_by_id(id);
    if (d == nullptr) return;

    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Condition;
        e.target = label(bearer);
        e.action = "loses " + std::string(to_string(d->kind));
        record(std::move(e));
    }
    bearer.remove_condition(id);
}

void ActionResolver::knock_prone(Combatant& target, Combatant* source) {
    target.prone = true;
    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Condition;
        e.target = label(target);
        e.action = "is knocked prone";
        if (source != nullptr) e.actor = label(*source);
        record(std::move(e));
    }
}

void ActionResolver::paralyze(Combatant& target, Combatant& source, u8 dc) {
    Duration d;
    d.kind = DurationKind::Paralyzed;
    d.source = &source;
    d.anchor = &source;
    d.tick_at = TurnBoundary::StartOfTurn;
    d.rounds_remaining = 10;
    d.escape_save = Ability::Con;
    d.escape_dc = dc;
    apply_condition(target, d);
    target.end_concentration();
}

void ActionResolver::expire(Combatant& bearer, const Duration& duration) {
    if (duration.kind == DurationKind::AcidArrow) {
        const i32 damage = dice_.roll(duration.slot, 4);
        take_damage(bearer, damage, DamageType::Acid, duration.source, "Melf's Acid Arrow");
        return;
    }

    if (tracing()) {
        TraceEvent e;
        e.kind = TraceKind::Condition;
        e.target = label(bearer);
        e.action = "loses " + std::string(to_string(duration.kind));
        e.detail = "expired";
        record(std::move(e));
    }
}

void ActionResolver::turn_boundary(Combatant& actor, TurnBoundary boundary, std::span<Combatant* const> roster) {
    struct Pending {
        Combatant* bearer;
        u32 id;
    };

    // Hooks can add or remove conditions anywhere, so collect ids first
    std::vector<Pending> pending;
    for (Combatant* c : roster) {
        for (const Duration& d : c->conditions) {
            const bool escape = boundary == TurnBoundary::EndOfTurn && c == &actor && d.has_escape_save();
            const bool ticks = d.anchor == &actor && d.tick_at == boundary && d.has_counter();
            if (escape || ticks) pending.push_back({c, d.id});
        }
    }

    for (const Pending& p : pending) {
        Duration* d = p.bearer->find_condition_by_id(p.id);
        if (d == nullptr) continue;

        if (boundary == TurnBoundary::EndOfTurn && p.bearer == &actor && d->has_escape_save()) {
            const Duration copy = *d;
            if (saving_throw(*p.bearer, copy.escape_save, copy.escape_dc, to_string(copy.kind))) {
                end_condition(*p.bearer, copy.id);
                continue;
            }
            d = p.bearer->find_condition_by_id(p.id);
            if (d == nullptr) continue;
        }

        if (d->anchor == &actor && d->tick_at == boundary && d->has_counter()) {
            if (--d->rounds_remaining <= 0) {
                const Duration copy = *d;
                p.bearer->remove_condition(copy.id);
                expire(*p.bearer, copy);
            }
        }
    }

    if (boundary == TurnBoundary::StartOfTurn) trigger_spirit_guardians(actor);
}

void ActionResolver::trigger_spirit_guardians(Combatant& actor) {
    if (!actor.is_conscious()) return;

    const Duration* strongest = nullptr;
    for (const Duration& d : actor.conditions) {
        if (d.kind != DurationKind::SpiritGuardians || d.source == nullptr) continue;
        if (strongest == nullptr || d.slot > strongest->slot) strongest = &d;
    }
    if (strongest == nullptr) return;

    Combatant& caster = *strongest->source;
    const i32 damage = dice_.roll(strongest->slot, 8);
    half_save_damage(caster, actor, Ability::Wis, caster.spell_save_dc(), damage, DamageType::Radiant,
                     "Spirit Guardians");
}

// ==============================================================================
// Tracing
// ==============================================================================

void ActionResolver::note(std::string text) {
    if (!tracing()) return;
    TraceEvent e;
    e.kind = TraceKind::Note;
    e.detail = std::move(text);
    record(std::move(e));
}

void ActionResolver::record(TraceEvent event) {
    if (!tracing()) return;
    event.encounter = encounter_;
    event.round = round_;
    trace_->record(std::move(event));
}

} // namespace d20
