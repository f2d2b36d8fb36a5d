#include "engine/encounter.hpp"
#include <algorithm>
#include <utility>

namespace d20 {

// ==============================================================================
// Target Filter
// ==============================================================================

bool TargetFilter::accepts(const Combatant& chooser, const Combatant& candidate) const {
    if (candidate.is_destroyed()) return false;
    if (exclude_self && &candidate == &chooser) return false;
    if (down_only && !candidate.is_down()) return false;
    if (conscious_only && !candidate.is_conscious()) return false;
    if (wounded_only && !candidate.is_wounded()) return false;
    if (visible_only && candidate.is_hidden_from(chooser)) return false;
    if (undead_only && !candidate.is_undead()) return false;
    if (damage_type && candidate.immune_to(*damage_type)) return false;
    if (lacking && candidate.has_condition(*lacking)) return false;
    return true;
}

// ==============================================================================
// Encounter
// ==============================================================================

Encounter::Encounter(std::span<Combatant> party, std::span<Combatant> monsters, DayState& day,
                     ActionResolver& resolver, u32 max_rounds)
    : day_(day), resolver_(resolver), max_rounds_(max_rounds) {
    party_.reserve(party.size());
    monsters_.reserve(monsters.size());
    for (auto& c : party) party_.push_back(&c);
    for (auto& c : monsters) monsters_.push_back(&c);

    all_.reserve(party_.size() + monsters_.size());
    all_.insert(all_.end(), party_.begin(), party_.end());
    all_.insert(all_.end(), monsters_.begin(), monsters_.end());
}

EncounterOutcome Encounter::run() {
    start();
    while (play_round()) {
    }
    return outcome_;
}

void Encounter::start() {
    if (state_ != EncounterState::NotStarted) return;

    resolver_.set_context(static_cast<u8>(day_.encounter_index + 1), 0);
    roll_initiative();

    for (Combatant* c : order_) {
        if (c->team == Team::Party) {
            apply_rations(*c, day_.config, day_.encounters_since_short_rest, day_.encounters_since_long_rest);
        }
        if (c->behavior.start_encounter != nullptr) {
            c->behavior.start_encounter(*c, *this);
        }
    }

    state_ = EncounterState::Active;
    check_termination();
}

void Encounter::roll_initiative() {
    std::vector<std::pair<i32, Combatant*>> rolls;
    rolls.reserve(all_.size());
    for (Combatant* c : all_) {
        const i32 roll = static_cast<i32>(dice().roll(20)) + c->modifier(Ability::Dex) + c->initiative_bonus;
        rolls.emplace_back(roll, c);
    }

    // Ties keep the party ahead of the monsters and each side in roster order
    std::stable_sort(rolls.begin(), rolls.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    order_.clear();
    order_.reserve(rolls.size());
    for (const auto& [roll, c] : rolls) order_.push_back(c);

    if (resolver_.tracing()) {
        std::string text = "Initiative:";
        for (const auto& [roll, c] : rolls) {
            text += " " + label(*c) + "(" + std::to_string(roll) + ")";
        }
        resolver_.note(std::move(text));
    }
}

bool Encounter::play_round() {
    if (!active()) return false;

    ++round_;
    if (round_ > max_rounds_) {
        round_ = max_rounds_;
        conclude(EncounterOutcome::RoundLimit);
        return false;
    }

    resolver_.set_context(static_cast<u8>(day_.encounter_index + 1), round_);

    for (Combatant* c : order_) {
        if (!active()) break;
        if (!c->is_conscious()) continue;
        play_turn(*c);
    }

    return active();
}

void Encounter::play_turn(Combatant& actor) {
    if (!active() || !actor.is_conscious()) return;

    actor.begin_turn();
    resolver_.turn_boundary(actor, TurnBoundary::StartOfTurn, all_);

    if (actor.is_conscious() && !actor.is_incapacitated()) {
        actor.prone = false;
        tick_concentration(actor);
        run_options(actor);
    }

    resolver_.turn_boundary(actor, TurnBoundary::EndOfTurn, all_);
    check_termination();
}

void Encounter::run_options(Combatant& actor) {
    u32 groups_used = 0;
    for (const ActionOption& option : actor.behavior.options) {
        if (!active() || !actor.is_conscious()) break;
        const u32 group_bit = option.group == 0 ? 0u : (1u << (option.group % 32));
        if ((groups_used & group_bit) != 0) continue;
        if (!slot_ready(actor, option.slot)) continue;
        if (option.available != nullptr && !option.available(actor, *this)) continue;
        option.execute(actor, *this);
        groups_used |= group_bit;
    }
}

void Encounter::tick_concentration(Combatant& actor) {
    if (!actor.concentration || actor.concentration->rounds_remaining <= 0) return;

    if (--actor.concentration->rounds_remaining <= 0) {
        actor.end_concentration();
        if (resolver_.tracing()) resolver_.note(label(actor) + "'s concentration spell ends");
    }
}

void Encounter::check_termination() {
    if (!active()) return;

    const auto out = [](const Combatant* c) { return !c->is_conscious(); };
    const bool party_out = std::all_of(party_.begin(), party_.end(), out);
    const bool monsters_out = std::all_of(monsters_.begin(), monsters_.end(), out);

    if (party_out && monsters_out) {
        day_.simultaneous_defeat = true;
        conclude(EncounterOutcome::SimultaneousDefeat);
    } else if (party_out) {
        conclude(EncounterOutcome::PartyDefeat);
    } else if (monsters_out) {
        conclude(EncounterOutcome::PartyVictory);
    }
}

void Encounter::conclude(EncounterOutcome outcome) {
    state_ = EncounterState::Concluded;
    outcome_ = outcome;
    day_.total_rounds += round_;
    if (resolver_.tracing()) {
        resolver_.note("Encounter ends after " + std::to_string(round_) + " rounds: "
                       + std::string(to_string(outcome)));
    }
}

// ==============================================================================
// Target Selection
// ==============================================================================

std::vector<Combatant*> Encounter::valid_targets(const Combatant& chooser, const TargetFilter& filter) const {
    const auto& side = filter.side == TargetSide::Allies ? allies_of(chooser) : foes_of(chooser);
    std::vector<Combatant*> result;
    result.reserve(side.size());
    for (Combatant* c : side) {
        if (filter.accepts(chooser, *c)) result.push_back(c);
    }
    return result;
}

u32 Encounter::count_targets(const Combatant& chooser, const TargetFilter& filter) const {
    const auto& side = filter.side == TargetSide::Allies ? allies_of(chooser) : foes_of(chooser);
    u32 count = 0;
    for (const Combatant* c : side) {
        if (filter.accepts(chooser, *c)) ++count;
    }
    return count;
}

Combatant* Encounter::choose_target(const Combatant& chooser, const TargetFilter& filter) {
    std::vector<Combatant*> valid = valid_targets(chooser, filter);
    if (valid.empty()) return nullptr;
    return valid[dice().pick_index(static_cast<u32>(valid.size()))];
}

std::vector<Combatant*> Encounter::choose_targets(const Combatant& chooser, u32 n,
                                                  const TargetFilter& filter, bool replacement) {
    std::vector<Combatant*> valid = valid_targets(chooser, filter);
    if (valid.empty() || n == 0) return {};

    if (replacement) {
        std::vector<Combatant*> picks;
        picks.reserve(n);
        for (u32 i = 0; i < n; ++i) {
            picks.push_back(valid[dice().pick_index(static_cast<u32>(valid.size()))]);
        }
        return picks;
    }

    if (n >= valid.size()) return valid;

    // Partial Fisher-Yates shuffle
    for (u32 i = 0; i < n; ++i) {
        const u32 j = i + dice().pick_index(static_cast<u32>(valid.size()) - i);
        std::swap(valid[i], valid[j]);
    }
    valid.resize(n);
    return valid;
}

} // namespace d20
