#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "core/weapon.hpp"
#include "engine/dice.hpp"
#include "engine/trace.hpp"
#include <span>
#include <string>
#include <string_view>

namespace d20 {

// ==============================================================================
// Resolution Inputs and Outputs
// ==============================================================================

struct AttackOptions {
    bool advantage       = false;
    bool disadvantage    = false;
    bool crit_on_hit     = false;   // Assassinate against a surprised target
    bool allow_reaction  = true;    // Target may use Uncanny Dodge
};

struct DamageRoll {
    i32 primary = 0;
    i32 secondary = 0;
    DamageType primary_type = DamageType::Bludgeoning;
    DamageType secondary_type = DamageType::Radiant;

    i32 total() const { return primary + secondary; }
};

struct AttackResult {
    AttackOutcome outcome = AttackOutcome::Miss;
    u32 natural = 0;
    i32 total = 0;
    i32 damage_dealt = 0;

    bool hit() const { return outcome != AttackOutcome::Miss; }
};

// ==============================================================================
// Action Resolver
// Resolves single attacks, saves, damage, healing and conditions. Owns no
// combatant state; every change lands on the combatants passed in. Writes an
// event to the trace sink when one is attached.
// ==============================================================================

class ActionResolver {
public:
    explicit ActionResolver(DiceRoller& dice, TraceLog* trace = nullptr)
        : dice_(dice), trace_(trace) {}

    DiceRoller& dice() { return dice_; }
    TraceLog* trace() { return trace_; }
    bool tracing() const { return trace_ != nullptr; }

    void set_context(u8 encounter, u32 round) {
        encounter_ = encounter;
        round_ = round;
    }

    // ---- Attacks ------------------------------------------------------------

    // Advantage sources; a guiding bolt mark is consumed unless read_only
    bool attack_advantage(Combatant& attacker, Combatant& target, bool read_only);
    bool attack_disadvantage(const Combatant& attacker, const Combatant& target) const;

    i32 attack_bonus(const Combatant& attacker, const Weapon& weapon) const;

    // Roll to hit without dealing damage
    AttackResult roll_attack(Combatant& attacker, Combatant& target, const Weapon& weapon,
                             const AttackOptions& options = {});

    DamageRoll roll_damage(const Combatant& attacker, const Weapon& weapon, AttackOutcome outcome);

    // Full attack: hit roll, damage, riders and reactions
    AttackResult weapon_attack(Combatant& attacker, Combatant& target, const Weapon& weapon,
                               const AttackOptions& options = {});

    // ---- Damage -------------------------------------------------------------

    // Damage after armor, resistance, vulnerability and immunity
    i32 adjusted_damage(const Combatant& target, i32 amount, DamageType type) const;

    // Applies both parts of a damage roll, then resolves falling unconscious,
    // concentration checks and turning. Returns the hit points actually lost.
    i32 take_damage(Combatant& target, const DamageRoll& roll, Combatant* source,
                    std::string_view action);

    i32 take_damage(Combatant& target, i32 amount, DamageType type, Combatant* source,
                    std::string_view action);

    // Removes the target from play for the rest of the encounter
    void destroy(Combatant& target, Combatant* source, std::string_view action);

    // ---- Saving throws ------------------------------------------------------

    bool saving_throw(Combatant& target, Ability ability, i32 dc, std::string_view action,
                      bool advantage = false, bool disadvantage = false);

    // Full damage on a failed save, half on a success (Evasion: half and none)
    i32 half_save_damage(Combatant& caster, Combatant& target, Ability ability, i32 dc,
                         i32 damage, DamageType type, std::string_view action);

    // Damage only on a failed save
    i32 save_or_damage(Combatant& caster, Combatant& target, Ability ability, i32 dc,
                       i32 damage, DamageType type, std::string_view action);

    // ---- Healing ------------------------------------------------------------

    i32 heal(Combatant& healer, Combatant& target, i32 amount, std::string_view action);

    // ---- Conditions ---------------------------------------------------------

    u32 apply_condition(Combatant& bearer, Duration duration);
    void end_condition(Combatant& bearer, u32 id);

    void knock_prone(Combatant& target, Combatant* source);
    void paralyze(Combatant& target, Combatant& source, u8 dc);

    // Advances every duration anchored to `actor` at this boundary, runs
    // escape saves and expiry effects. Spirit guardians trigger here too.
    void turn_boundary(Combatant& actor, TurnBoundary boundary, std::span<Combatant* const> roster);

    // ---- Tracing ------------------------------------------------------------

    void note(std::string text);
    void record(TraceEvent event);

private:
    DiceRoller& dice_;
    TraceLog* trace_ = nullptr;
    u8 encounter_ = 0;
    u32 round_ = 0;

    void fall_unconscious(Combatant& target, i32 damage, DamageType type);
    void concentration_check(Combatant& target, i32 damage);
    void apply_rider(Combatant& attacker, Combatant& target, const Weapon& weapon);
    void trigger_spirit_guardians(Combatant& actor);
    void expire(Combatant& bearer, const Duration& duration);
    i32 bless_bonus(const Combatant& c);
};

// Name shown in traces and reports
inline std::string label(const Combatant& c) {
    return std::string(c.name.view());
}

} // namespace d20
