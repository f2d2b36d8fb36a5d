#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "engine/dice.hpp"
#include "engine/ration.hpp"
#include "engine/resolver.hpp"
#include <optional>
#include <span>
#include <vector>

namespace d20 {

// ==============================================================================
// Day State - Day-scoped record passed by reference into every encounter
// ==============================================================================

struct DayState {
    DayConfig config;
    u8 encounter_index = 0;               // 0-based index of the current encounter
    u8 encounters_since_short_rest = 0;
    u8 encounters_since_long_rest = 0;
    u8 encounters_completed = 0;
    bool simultaneous_defeat = false;
    u32 total_rounds = 0;
    std::span<Combatant> party{};

    bool any_party_member_down() const {
        for (const auto& pc : party) {
            if (pc.is_down()) return true;
        }
        return false;
    }

    u32 party_conscious() const {
        u32 count = 0;
        for (const auto& pc : party) {
            if (pc.is_conscious()) ++count;
        }
        return count;
    }
};

// ==============================================================================
// Target Selection
// ==============================================================================

enum class TargetSide : u8 {
    Foes   = 0,
    Allies = 1
};

struct TargetFilter {
    TargetSide side = TargetSide::Foes;
    bool conscious_only = true;       // hp > 0
    bool down_only = false;           // Unconscious and revivable
    bool wounded_only = false;        // Below maximum hit points
    bool visible_only = false;        // Not hidden from the chooser
    bool undead_only = false;
    bool exclude_self = false;
    std::optional<DamageType> damage_type{};  // Skip targets immune to it
    std::optional<DurationKind> lacking{};    // Skip targets already carrying it

    static TargetFilter foes() { return TargetFilter{}; }

    static TargetFilter allies() {
        TargetFilter f;
        f.side = TargetSide::Allies;
        return f;
    }

    static TargetFilter downed_allies() {
        TargetFilter f;
        f.side = TargetSide::Allies;
        f.conscious_only = false;
        f.down_only = true;
        return f;
    }

    TargetFilter& of_type(DamageType t) { damage_type = t; return *this; }
    TargetFilter& visible() { visible_only = true; return *this; }
    TargetFilter& without(DurationKind k) { lacking = k; return *this; }

    bool accepts(const Combatant& chooser, const Combatant& candidate) const;
};

// ==============================================================================
// Encounter - NotStarted -> Active -> Concluded
// ==============================================================================

enum class EncounterState : u8 {
    NotStarted = 0,
    Active     = 1,
    Concluded  = 2
};

enum class EncounterOutcome : u8 {
    Undecided          = 0,
    PartyVictory       = 1,
    PartyDefeat        = 2,
    SimultaneousDefeat = 3,
    RoundLimit         = 4
};

inline constexpr std::string_view to_string(EncounterOutcome o) {
    switch (o) {
        case EncounterOutcome::Undecided:          return "undecided";
        case EncounterOutcome::PartyVictory:       return "party victory";
        case EncounterOutcome::PartyDefeat:        return "party defeat";
        case EncounterOutcome::SimultaneousDefeat: return "simultaneous defeat";
        case EncounterOutcome::RoundLimit:         return "round limit";
        default: return "?";
    }
}

constexpr u32 DEFAULT_MAX_ROUNDS = 100;

class Encounter {
public:
    Encounter(std::span<Combatant> party, std::span<Combatant> monsters, DayState& day,
              ActionResolver& resolver, u32 max_rounds = DEFAULT_MAX_ROUNDS);

    Encounter(const Encounter&) = delete;
    Encounter& operator=(const Encounter&) = delete;

    // Runs the encounter to completion
    EncounterOutcome run();

    // Initiative and start-of-encounter hooks
    void start();

    // One pass through the initiative order; returns whether still active
    bool play_round();

    // A single combatant's turn with its boundary hooks
    void play_turn(Combatant& actor);

    EncounterState state() const { return state_; }
    EncounterOutcome outcome() const { return outcome_; }
    bool active() const { return state_ == EncounterState::Active; }
    u32 round() const { return round_; }
    const std::vector<Combatant*>& initiative_order() const { return order_; }
    std::span<Combatant* const> combatants() const { return all_; }

    const std::vector<Combatant*>& allies_of(const Combatant& c) const {
        return c.team == Team::Party ? party_ : monsters_;
    }
    const std::vector<Combatant*>& foes_of(const Combatant& c) const {
        return c.team == Team::Party ? monsters_ : party_;
    }

    // ---- Target selection -----------------------------------------------------

    std::vector<Combatant*> valid_targets(const Combatant& chooser, const TargetFilter& filter) const;
    u32 count_targets(const Combatant& chooser, const TargetFilter& filter) const;
    bool any_target(const Combatant& chooser, const TargetFilter& filter) const {
        return count_targets(chooser, filter) > 0;
    }

    // Uniform choice among valid targets, nullptr when there are none
    Combatant* choose_target(const Combatant& chooser, const TargetFilter& filter = {});

    // Up to n targets. Without replacement every valid target is returned when
    // there are no more than n of them.
    std::vector<Combatant*> choose_targets(const Combatant& chooser, u32 n,
                                           const TargetFilter& filter = {}, bool replacement = false);

    // ---- Context --------------------------------------------------------------

    DiceRoller& dice() { return resolver_.dice(); }
    ActionResolver& resolver() { return resolver_; }
    DayState& day() { return day_; }
    const DayState& day() const { return day_; }
    u8 encounters_since_short_rest() const { return day_.encounters_since_short_rest; }
    u8 encounters_since_long_rest() const { return day_.encounters_since_long_rest; }

private:
    std::vector<Combatant*> party_;
    std::vector<Combatant*> monsters_;
    std::vector<Combatant*> all_;
    std::vector<Combatant*> order_;
    DayState& day_;
    ActionResolver& resolver_;
    u32 max_rounds_;
    u32 round_ = 0;
    EncounterState state_ = EncounterState::NotStarted;
    EncounterOutcome outcome_ = EncounterOutcome::Undecided;

    void roll_initiative();
    void run_options(Combatant& actor);
    void tick_concentration(Combatant& actor);
    void check_termination();
    void conclude(EncounterOutcome outcome);
};

// Whether the combatant still holds the turn slot an option needs
inline bool slot_ready(const Combatant& c, TurnSlot slot) {
    switch (slot) {
        case TurnSlot::Action:      return c.action;
        case TurnSlot::BonusAction: return c.bonus_action;
        case TurnSlot::Reaction:    return c.reaction;
        case TurnSlot::Free:        return true;
    }
    return false;
}

} // namespace d20
