#include "catalog/scenario.hpp"
#include "engine/adventuring_day.hpp"
#include "engine/encounter.hpp"
#include "engine/rest.hpp"
#include "engine/trace.hpp"
#include <iostream>
#include <cassert>
#include <string>

using namespace d20;

u32 count_notes(const TraceLog& trace, const std::string& prefix) {
    u32 count = 0;
    for (const auto& e : trace.events()) {
        if (e.kind == TraceKind::Note && e.detail.rfind(prefix, 0) == 0) ++count;
    }
    return count;
}

// ==============================================================================
// Rests
// ==============================================================================

Combatant resting_fighter() {
    Combatant c("Fighter", Team::Party);
    c.hit_die = Dice(1, 10);
    c.hit_dice_total = 5;
    c.hit_dice_remaining = 5;
    c.base_max_hp = 40;
    c.reset_hp();
    return c;
}

void test_hit_dice_spending() {
    DiceRoller dice(1);

    // Threshold for 40 HP on d10 hit dice is 30
    Combatant healthy = resting_fighter();
    healthy.hp = 31;
    assert(spend_hit_dice(healthy, dice) == 0);
    assert(healthy.hit_dice_remaining == 5);

    Combatant wounded = resting_fighter();
    wounded.hp = 10;
    const i32 gained = spend_hit_dice(wounded, dice);
    assert(gained > 0);
    assert(wounded.hp == 10 + gained);
    assert(wounded.hit_dice_remaining < 5);
    assert(wounded.hp > 30 || wounded.hit_dice_remaining == 0);
    assert(wounded.hp <= wounded.max_hp);

    // Unconscious characters cannot spend hit dice
    Combatant down = resting_fighter();
    down.hp = 0;
    assert(spend_hit_dice(down, dice) == 0);
    assert(down.hit_dice_remaining == 5);
    std::cout << "[PASS] test_hit_dice_spending" << std::endl;
}

void test_short_and_long_rest() {
    DiceRoller dice(2);
    Combatant c = resting_fighter();
    c.resource(ResourceId::SecondWind) = ResourcePool{0, 1};
    c.ration(ResourceId::SecondWind).interval = RestKind::Short;
    c.set_spell_slots({2});
    c.spend_slot(1);
    c.prone = true;
    c.death_ward = true;
    c.hp = 35;
    c.hit_dice_remaining = 1;

    take_short_rest(c, dice);
    assert(!c.prone);
    assert(c.resource(ResourceId::SecondWind).remaining == 1);
    assert(c.slot_count(1) == 1);
    assert(c.death_ward);
    assert(c.hp == 35);

    c.hp = 0;
    take_long_rest(c, dice);
    assert(c.hp == c.max_hp);
    assert(c.hit_dice_remaining == 5);
    assert(c.slot_count(1) == 2);
    assert(!c.death_ward);
    std::cout << "[PASS] test_short_and_long_rest" << std::endl;
}

// ==============================================================================
// Adventuring day
// ==============================================================================

void test_monster_names() {
    Scenario scenario = ScenarioParser::build(1, default_party_classes(), {"Kobold", "Ogre"}, {3, 1});
    DiceRoller dice(3);
    AdventuringDay day(scenario, dice);

    auto monsters = day.create_monsters();
    assert(monsters.size() == 4);
    assert(monsters[0].name == "Kobold 1");
    assert(monsters[2].name == "Kobold 3");
    assert(monsters[3].name == "Ogre");
    for (const auto& m : monsters) {
        assert(m.team == Team::Monsters);
        assert(m.hp > 0 && m.hp == m.max_hp);
    }

    assert(day.party().size() == 4);
    assert(day.party()[0].name == "Cleric");

    Scenario twins = ScenarioParser::build(1, {"Fighter", "Fighter"}, {"Kobold"}, {1});
    AdventuringDay twin_day(twins, dice);
    assert(twin_day.party()[0].name == "Fighter 1");
    assert(twin_day.party()[1].name == "Fighter 2");
    std::cout << "[PASS] test_monster_names" << std::endl;
}

void test_easy_day_runs_all_encounters() {
    Scenario scenario = ScenarioParser::build(8, default_party_classes(), {"Giant rat"}, {1});

    for (u64 seed = 1; seed <= 10; ++seed) {
        DiceRoller dice(seed);
        TraceLog trace;
        DayResult result = simulate_day(scenario, dice, &trace);

        assert(result.survivors == 4);
        assert(result.encounters_completed == 6);
        assert(!result.simultaneous_defeat);
        assert(result.rounds >= 6);

        // Short rests after the second and fourth encounter
        assert(count_notes(trace, "Encounter ") == 6 + 6);
        assert(count_notes(trace, "Short rest") == 2);
    }
    std::cout << "[PASS] test_easy_day_runs_all_encounters" << std::endl;
}

void test_hopeless_day_stops_early() {
    Scenario scenario = ScenarioParser::build(1, default_party_classes(), {"Ogre"}, {8});

    for (u64 seed = 1; seed <= 10; ++seed) {
        DiceRoller dice(seed);
        AdventuringDay day(scenario, dice);
        DayResult result = day.run();

        assert(result.survivors == 0);
        assert(result.encounters_completed == 1);
        assert(day.state().party_conscious() == 0);
    }
    std::cout << "[PASS] test_hopeless_day_stops_early" << std::endl;
}

void test_day_determinism() {
    Scenario scenario = ScenarioParser::build(3, default_party_classes(), {"Orc", "Wolf"}, {2, 2});

    DiceRoller a(derive_seed(99, 5));
    DiceRoller b(derive_seed(99, 5));
    TraceLog trace_a;
    TraceLog trace_b;

    DayResult ra = simulate_day(scenario, a, &trace_a);
    DayResult rb = simulate_day(scenario, b, &trace_b);

    assert(ra.survivors == rb.survivors);
    assert(ra.encounters_completed == rb.encounters_completed);
    assert(ra.rounds == rb.rounds);
    assert(!trace_a.empty());
    assert(trace_a.render() == trace_b.render());

    // Tracing draws no extra random numbers
    DiceRoller c(derive_seed(99, 5));
    DayResult rc = simulate_day(scenario, c);
    assert(rc.survivors == ra.survivors && rc.rounds == ra.rounds);
    std::cout << "[PASS] test_day_determinism" << std::endl;
}

void test_day_result_bounds() {
    Scenario scenario = ScenarioParser::build(1, default_party_classes(), {"Kobold"}, {4});

    u32 total_survivors = 0;
    for (u64 i = 0; i < 200; ++i) {
        DiceRoller dice(derive_seed(7, i));
        DayResult result = simulate_day(scenario, dice);

        assert(result.survivors <= scenario.party_classes.size());
        assert(result.encounters_completed >= 1 && result.encounters_completed <= 6);
        if (result.simultaneous_defeat) assert(result.survivors == 0);
        if (result.encounters_completed < 6 && !result.simultaneous_defeat) assert(result.survivors == 0);
        total_survivors += result.survivors;
    }
    assert(total_survivors > 0);
    std::cout << "[PASS] test_day_result_bounds" << std::endl;
}

void test_every_monster_plays_a_day() {
    initialize_catalog();
    for (const auto& name : get_combatant_registry().names(Team::Monsters)) {
        std::vector<i32> stats;
        if (name == "Test") stats = {5, 13, 10, 30, 2, 2};
        Scenario scenario = ScenarioParser::build(5, default_party_classes(), {name}, {2}, stats);

        DiceRoller dice(11);
        DayResult result = simulate_day(scenario, dice);
        assert(result.survivors <= 4);
        assert(result.encounters_completed >= 1);
    }
    std::cout << "[PASS] test_every_monster_plays_a_day" << std::endl;
}

void test_round_limit_applies() {
    // A Test creature that cannot be hit and deals no damage stalls every encounter
    Scenario scenario = ScenarioParser::build(1, {"Fighter"}, {"Test"}, {1}, {-100, 200, 0, 1000, 1, 2});
    DiceRoller dice(12);
    DayResult result = simulate_day(scenario, dice, nullptr, 10);

    assert(result.encounters_completed == 6);
    assert(result.rounds == 60);
    assert(result.survivors == 1);
    std::cout << "[PASS] test_round_limit_applies" << std::endl;
}

// A monster that burns everyone, itself included, on its first turn
void detonate(Combatant& self, Encounter& encounter) {
    self.action = false;
    for (Combatant* c : encounter.combatants()) {
        encounter.resolver().take_damage(*c, 1000, DamageType::Fire, &self, "Detonate");
    }
}

const ActionOption DETONATE_OPTIONS[] = {
    {"Detonate", TurnSlot::Action, nullptr, detonate, 0},
};

Combatant make_bomb(const CombatantParams&, DiceRoller&) {
    Combatant c("Bomb", Team::Monsters);
    c.base_max_hp = 1000;
    c.reset_hp();
    c.behavior.options = DETONATE_OPTIONS;
    return c;
}

void test_simultaneous_defeat_ends_day() {
    initialize_catalog();
    get_combatant_registry().register_entry("Bomb", Team::Monsters, make_bomb);
    Scenario scenario = ScenarioParser::build(1, default_party_classes(), {"Bomb"}, {1});

    for (u64 seed = 1; seed <= 5; ++seed) {
        DiceRoller dice(seed);
        TraceLog trace;
        DayResult result = simulate_day(scenario, dice, &trace);

        assert(result.simultaneous_defeat);
        assert(result.survivors == 0);
        assert(result.encounters_completed == 1);

        // Nothing runs after the first encounter, healing included
        assert(count_notes(trace, "Encounter ") == 2);
        assert(count_notes(trace, "Short rest") == 0);
        for (const auto& e : trace.events()) assert(e.kind != TraceKind::Healing);

        const std::string outcome(to_string(EncounterOutcome::SimultaneousDefeat));
        assert(trace.render().find(outcome) != std::string::npos);
    }
    std::cout << "[PASS] test_simultaneous_defeat_ends_day" << std::endl;
}

int main() {
    std::cout << "=== Adventuring Day Tests ===" << std::endl;

    test_hit_dice_spending();
    test_short_and_long_rest();
    test_monster_names();
    test_easy_day_runs_all_encounters();
    test_hopeless_day_stops_early();
    test_day_determinism();
    test_day_result_bounds();
    test_every_monster_plays_a_day();
    test_round_limit_applies();
    test_simultaneous_defeat_ends_day();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
