#include "engine/adventuring_day.hpp"
#include "engine/rest.hpp"
#include <string>
#include <unordered_map>

namespace d20 {

namespace {

// Appends an ordinal when a name occurs more than once on a side
std::vector<std::string> numbered_names(const std::vector<std::string>& names) {
    std::unordered_map<std::string, u32> totals;
    for (const auto& n : names) ++totals[n];

    std::unordered_map<std::string, u32> seen;
    std::vector<std::string> result;
    result.reserve(names.size());
    for (const auto& n : names) {
        result.push_back(totals[n] > 1 ? n + " " + std::to_string(++seen[n]) : n);
    }
    return result;
}

} // namespace

AdventuringDay::AdventuringDay(const Scenario& scenario, DiceRoller& dice, TraceLog* trace, u32 max_rounds)
    : scenario_(scenario), dice_(dice), resolver_(dice, trace), max_rounds_(max_rounds) {
    initialize_catalog();
    create_party();
    state_.party = party_;
}

void AdventuringDay::create_party() {
    const auto& registry = get_combatant_registry();
    const auto names = numbered_names(scenario_.party_classes);

    CombatantParams params;
    params.level = scenario_.party_level;

    party_.clear();
    party_.reserve(scenario_.party_classes.size());
    for (size_t i = 0; i < scenario_.party_classes.size(); ++i) {
        const CatalogEntry* entry = registry.find(scenario_.party_classes[i], Team::Party);
        if (entry == nullptr) throw ConfigError("unknown class '" + scenario_.party_classes[i] + "'");

        Combatant pc = entry->create(params, dice_);
        pc.name = Name(names[i]);
        pc.index = static_cast<u8>(i);
        party_.push_back(std::move(pc));
    }
}

std::vector<Combatant> AdventuringDay::create_monsters() {
    const auto& registry = get_combatant_registry();

    std::vector<std::string> kinds;
    kinds.reserve(scenario_.monster_total());
    for (const auto& group : scenario_.monsters) {
        for (u32 i = 0; i < group.count; ++i) kinds.push_back(group.name);
    }
    const auto names = numbered_names(kinds);

    CombatantParams params;
    params.level = scenario_.party_level;
    params.test = scenario_.test_stats;

    std::vector<Combatant> monsters;
    monsters.reserve(kinds.size());
    for (size_t i = 0; i < kinds.size(); ++i) {
        const CatalogEntry* entry = registry.find(kinds[i], Team::Monsters);
        if (entry == nullptr) throw ConfigError("unknown monster '" + kinds[i] + "'");

        Combatant m = entry->create(params, dice_);
        m.name = Name(names[i]);
        m.index = static_cast<u8>(i);
        monsters.push_back(std::move(m));
    }
    return monsters;
}

DayResult AdventuringDay::run() {
    const u8 encounters = state_.config.encounters_per_long_rest;

    for (u8 index = 0; index < encounters; ++index) {
        if (index > 0) {
            if (state_.party_conscious() == 0) break;
            rest_between_encounters(index);
        }

        run_encounter(index);
        if (state_.simultaneous_defeat) break;
    }

    DayResult result;
    result.simultaneous_defeat = state_.simultaneous_defeat;
    result.survivors = state_.simultaneous_defeat ? 0 : count_survivors();
    result.encounters_completed = state_.encounters_completed;
    result.rounds = state_.total_rounds;
    return result;
}

void AdventuringDay::rest_between_encounters(u8 next_index) {
    resolver_.set_context(0, 0);

    if (next_index % state_.config.encounters_per_short_rest == 0) {
        if (resolver_.tracing()) resolver_.note("Short rest");
        for (auto& pc : party_) take_short_rest(pc, dice_);
        if (resolver_.tracing()) {
            for (const auto& pc : party_) {
                resolver_.note(label(pc) + " HP " + std::to_string(pc.hp) + "/" + std::to_string(pc.max_hp));
            }
        }
    } else {
        for (auto& pc : party_) pc.reset_conditions();
    }
}

void AdventuringDay::run_encounter(u8 index) {
    state_.encounter_index = index;
    state_.encounters_since_short_rest = static_cast<u8>(index % state_.config.encounters_per_short_rest);
    state_.encounters_since_long_rest = index;

    std::vector<Combatant> monsters = create_monsters();

    resolver_.set_context(static_cast<u8>(index + 1), 0);
    if (resolver_.tracing()) {
        resolver_.note("Encounter " + std::to_string(index + 1) + ": " + scenario_.label());
    }

    Encounter encounter(party_, monsters, state_, resolver_, max_rounds_);
    encounter.run();
    ++state_.encounters_completed;

    if (state_.simultaneous_defeat) return;

    for (auto& pc : party_) {
        if (pc.is_conscious() && pc.behavior.end_encounter != nullptr) {
            pc.behavior.end_encounter(pc, encounter);
        }
    }
}

u32 AdventuringDay::count_survivors() const {
    u32 count = 0;
    for (const auto& pc : party_) {
        if (pc.hp > 0) ++count;
    }
    return count;
}

DayResult simulate_day(const Scenario& scenario, DiceRoller& dice, TraceLog* trace, u32 max_rounds) {
    AdventuringDay day(scenario, dice, trace, max_rounds);
    return day.run();
}

} // namespace d20
