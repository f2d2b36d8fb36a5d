#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "catalog/scenario.hpp"
#include "engine/dice.hpp"
#include "engine/encounter.hpp"
#include "engine/resolver.hpp"
#include "engine/trace.hpp"
#include <vector>

namespace d20 {

// ==============================================================================
// Day Result
// ==============================================================================

struct DayResult {
    u32 survivors = 0;              // Party members above 0 HP at the end of the day
    bool simultaneous_defeat = false;
    u8 encounters_completed = 0;
    u32 rounds = 0;
};

// ==============================================================================
// Adventuring Day
// One Monte Carlo trial: the party fights the scenario's monsters up to six
// times, short resting after the second and fourth encounter. The day stops
// early once nobody in the party is conscious. A simultaneous defeat ends the
// day with no survivors.
// ==============================================================================

class AdventuringDay {
public:
    AdventuringDay(const Scenario& scenario, DiceRoller& dice, TraceLog* trace = nullptr,
                   u32 max_rounds = DEFAULT_MAX_ROUNDS);

    AdventuringDay(const AdventuringDay&) = delete;
    AdventuringDay& operator=(const AdventuringDay&) = delete;

    DayResult run();

    // Fresh monsters for one encounter, named "Kobold 1", "Kobold 2", ...
    std::vector<Combatant> create_monsters();

    std::vector<Combatant>& party() { return party_; }
    const std::vector<Combatant>& party() const { return party_; }
    const DayState& state() const { return state_; }

private:
    const Scenario& scenario_;
    DiceRoller& dice_;
    ActionResolver resolver_;
    u32 max_rounds_;
    std::vector<Combatant> party_;
    DayState state_;

    void create_party();
    void rest_between_encounters(u8 next_index);
    void run_encounter(u8 index);
    u32 count_survivors() const;
};

// Convenience wrapper: builds and runs one day
DayResult simulate_day(const Scenario& scenario, DiceRoller& dice, TraceLog* trace = nullptr,
                       u32 max_rounds = DEFAULT_MAX_ROUNDS);

} // namespace d20
