#include "core/combatant.hpp"
#include "engine/dice.hpp"
#include "engine/encounter.hpp"
#include "engine/resolver.hpp"
#include <iostream>
#include <algorithm>
#include <cassert>
#include <vector>

using namespace d20;

// ==============================================================================
// Scripted combatants
// ==============================================================================

int first_choice_runs = 0;
int second_choice_runs = 0;
int free_runs = 0;
int late_action_runs = 0;

// Hits one random conscious foe for damage_modifier of its first weapon
void strike(Combatant& self, Encounter& encounter) {
    self.action = false;
    Combatant* target = encounter.choose_target(self);
    if (target == nullptr) return;
    encounter.resolver().take_damage(*target, self.weapons[0].damage_modifier, DamageType::Bludgeoning,
                                     &self, "Strike");
}

// Drops everyone still standing, itself included
void detonate(Combatant& self, Encounter& encounter) {
    self.action = false;
    for (Combatant* c : encounter.combatants()) {
        encounter.resolver().take_damage(*c, 1000, DamageType::Fire, &self, "Detonate");
    }
}

void first_choice(Combatant&, Encounter&) { ++first_choice_runs; }
void second_choice(Combatant&, Encounter&) { ++second_choice_runs; }
void free_extra(Combatant&, Encounter&) { ++free_runs; }
void spend_action(Combatant& self, Encounter&) { self.action = false; }
void late_action(Combatant&, Encounter&) { ++late_action_runs; }

bool never(const Combatant&, const Encounter&) { return false; }

const ActionOption STRIKE_OPTIONS[] = {
    {"Strike", TurnSlot::Action, nullptr, strike, 0},
};

const ActionOption DETONATE_OPTIONS[] = {
    {"Detonate", TurnSlot::Action, nullptr, detonate, 0},
};

const ActionOption GROUPED_OPTIONS[] = {
    {"Unavailable", TurnSlot::Free, never, second_choice, 1},
    {"First", TurnSlot::Free, nullptr, first_choice, 1},
    {"Second", TurnSlot::Free, nullptr, second_choice, 1},
    {"Extra", TurnSlot::Free, nullptr, free_extra, 0},
    {"Spend", TurnSlot::Action, nullptr, spend_action, 0},
    {"Late", TurnSlot::Action, nullptr, late_action, 0},
};

Combatant dummy(std::string_view name, Team team, i32 hp) {
    Combatant c(name, team);
    c.base_max_hp = hp;
    c.reset_hp();
    return c;
}

Combatant striker(std::string_view name, Team team, i32 hp, i8 damage) {
    Combatant c = dummy(name, team, hp);
    Weapon w("Fist", Dice(), DamageType::Bludgeoning);
    w.damage_modifier = damage;
    c.weapons.push_back(w);
    c.behavior.options = STRIKE_OPTIONS;
    return c;
}

// ==============================================================================
// Tests
// ==============================================================================

void test_target_filter() {
    Combatant chooser = dummy("Cleric", Team::Party, 10);
    Combatant zombie = dummy("Zombie", Team::Monsters, 20);
    zombie.undead_cr = 0.25f;
    zombie.immunities = damage_bit(DamageType::Poison);

    TargetFilter foes = TargetFilter::foes();
    assert(foes.accepts(chooser, zombie));
    assert(!TargetFilter::foes().of_type(DamageType::Poison).accepts(chooser, zombie));
    assert(TargetFilter::foes().of_type(DamageType::Radiant).accepts(chooser, zombie));

    TargetFilter undead = TargetFilter::foes();
    undead.undead_only = true;
    assert(undead.accepts(chooser, zombie));
    Combatant kobold = dummy("Kobold", Team::Monsters, 5);
    assert(!undead.accepts(chooser, kobold));

    TargetFilter wounded = TargetFilter::allies();
    wounded.wounded_only = true;
    assert(!wounded.accepts(chooser, chooser));
    chooser.hp = 4;
    assert(wounded.accepts(chooser, chooser));

    TargetFilter others = TargetFilter::allies();
    others.exclude_self = true;
    assert(!others.accepts(chooser, chooser));

    Duration mark;
    mark.kind = DurationKind::GuidingBolt;
    zombie.add_condition(mark);
    assert(!TargetFilter::foes().without(DurationKind::GuidingBolt).accepts(chooser, zombie));

    // Hidden candidates are skipped only by visible filters
    kobold.stealth = 30;
    assert(TargetFilter::foes().accepts(chooser, kobold));
    assert(!TargetFilter::foes().visible().accepts(chooser, kobold));

    // Down but revivable
    Combatant rogue = dummy("Rogue", Team::Party, 10);
    rogue.hp = 0;
    assert(!TargetFilter::allies().accepts(chooser, rogue));
    assert(TargetFilter::downed_allies().accepts(chooser, rogue));

    // Destroyed creatures are never targets
    rogue.max_hp = 0;
    assert(!TargetFilter::downed_allies().accepts(chooser, rogue));
    std::cout << "[PASS] test_target_filter" << std::endl;
}

void test_party_victory() {
    DiceRoller dice(1);
    ActionResolver resolver(dice);
    DayState day;

    std::vector<Combatant> party{striker("Fighter", Team::Party, 30, 100)};
    std::vector<Combatant> monsters{dummy("Kobold", Team::Monsters, 5)};
    day.party = party;

    Encounter encounter(party, monsters, day, resolver);
    assert(encounter.state() == EncounterState::NotStarted);
    assert(encounter.run() == EncounterOutcome::PartyVictory);
    assert(encounter.state() == EncounterState::Concluded);
    assert(encounter.round() == 1);
    assert(day.total_rounds == 1);
    assert(!day.simultaneous_defeat);
    assert(party[0].hp == 30);
    std::cout << "[PASS] test_party_victory" << std::endl;
}

void test_party_defeat() {
    DiceRoller dice(2);
    ActionResolver resolver(dice);
    DayState day;

    std::vector<Combatant> party{dummy("Wizard", Team::Party, 8), dummy("Rogue", Team::Party, 9)};
    std::vector<Combatant> monsters{striker("Ogre", Team::Monsters, 59, 50)};
    day.party = party;

    Encounter encounter(party, monsters, day, resolver);
    assert(encounter.run() == EncounterOutcome::PartyDefeat);
    assert(encounter.round() == 2);
    assert(day.party_conscious() == 0);
    assert(day.any_party_member_down());
    std::cout << "[PASS] test_party_defeat" << std::endl;
}

void test_simultaneous_defeat() {
    DiceRoller dice(3);
    ActionResolver resolver(dice);
    DayState day;

    std::vector<Combatant> party{dummy("Fighter", Team::Party, 20)};
    std::vector<Combatant> monsters{dummy("Kobold", Team::Monsters, 5)};
    monsters[0].behavior.options = DETONATE_OPTIONS;
    day.party = party;

    Encounter encounter(party, monsters, day, resolver);
    assert(encounter.run() == EncounterOutcome::SimultaneousDefeat);
    assert(day.simultaneous_defeat);
    assert(!party[0].is_conscious() && !monsters[0].is_conscious());
    std::cout << "[PASS] test_simultaneous_defeat" << std::endl;
}

void test_round_limit() {
    DiceRoller dice(4);
    ActionResolver resolver(dice);
    DayState day;

    std::vector<Combatant> party{dummy("Fighter", Team::Party, 20)};
    std::vector<Combatant> monsters{dummy("Kobold", Team::Monsters, 5)};
    day.party = party;

    Encounter encounter(party, monsters, day, resolver, 5);
    assert(encounter.run() == EncounterOutcome::RoundLimit);
    assert(encounter.round() == 5);
    assert(day.total_rounds == 5);
    assert(!encounter.active());
    assert(!encounter.play_round());
    std::cout << "[PASS] test_round_limit" << std::endl;
}

void test_option_groups_and_slots() {
    DiceRoller dice(5);
    ActionResolver resolver(dice);
    DayState day;

    std::vector<Combatant> party{dummy("Cleric", Team::Party, 20)};
    std::vector<Combatant> monsters{dummy("Kobold", Team::Monsters, 5)};
    party[0].behavior.options = GROUPED_OPTIONS;
    day.party = party;

    first_choice_runs = second_choice_runs = free_runs = late_action_runs = 0;

    Encounter encounter(party, monsters, day, resolver);
    encounter.start();
    assert(encounter.active());

    encounter.play_turn(party[0]);
    assert(first_choice_runs == 1);
    assert(second_choice_runs == 0);
    assert(free_runs == 1);
    assert(late_action_runs == 0);

    encounter.play_turn(party[0]);
    assert(first_choice_runs == 2);
    assert(second_choice_runs == 0);
    std::cout << "[PASS] test_option_groups_and_slots" << std::endl;
}

void test_down_combatants_skip_turns() {
    DiceRoller dice(6);
    ActionResolver resolver(dice);
    DayState day;

    std::vector<Combatant> party{dummy("Cleric", Team::Party, 20), dummy("Rogue", Team::Party, 20)};
    std::vector<Combatant> monsters{dummy("Kobold", Team::Monsters, 5)};
    party[1].behavior.options = GROUPED_OPTIONS;
    party[1].hp = 0;
    day.party = party;

    first_choice_runs = free_runs = 0;

    Encounter encounter(party, monsters, day, resolver, 3);
    encounter.run();
    assert(first_choice_runs == 0 && free_runs == 0);
    std::cout << "[PASS] test_down_combatants_skip_turns" << std::endl;
}

void test_turn_housekeeping() {
    DiceRoller dice(7);
    ActionResolver resolver(dice);
    DayState day;

    std::vector<Combatant> party{dummy("Cleric", Team::Party, 20), dummy("Fighter", Team::Party, 20)};
    std::vector<Combatant> monsters{dummy("Kobold", Team::Monsters, 5)};
    day.party = party;

    Encounter encounter(party, monsters, day, resolver);
    encounter.start();

    // Prone creatures stand up on their turn
    monsters[0].prone = true;
    encounter.play_turn(monsters[0]);
    assert(!monsters[0].prone);

    // Concentration runs out on the caster's own turn
    Duration bless;
    bless.kind = DurationKind::Blessed;
    bless.source = &party[0];
    party[1].add_condition(bless);

    Concentration c;
    c.effect = DurationKind::Blessed;
    c.rounds_remaining = 2;
    c.targets.push_back(&party[1]);
    party[0].concentration = c;

    encounter.play_turn(party[0]);
    assert(party[0].concentration);
    assert(party[1].has_condition(DurationKind::Blessed));

    encounter.play_turn(party[0]);
    assert(!party[0].concentration);
    assert(!party[1].has_condition(DurationKind::Blessed));
    std::cout << "[PASS] test_turn_housekeeping" << std::endl;
}

void test_target_choice() {
    DiceRoller dice(8);
    ActionResolver resolver(dice);
    DayState day;

    std::vector<Combatant> party{dummy("Wizard", Team::Party, 20)};
    std::vector<Combatant> monsters;
    for (int i = 0; i < 5; ++i) monsters.push_back(dummy("Kobold", Team::Monsters, 5));
    monsters[4].hp = 0;
    day.party = party;

    Encounter encounter(party, monsters, day, resolver);
    encounter.start();

    assert(encounter.initiative_order().size() == 6);
    assert(encounter.count_targets(party[0], TargetFilter::foes()) == 4);

    // Without replacement: distinct picks, all of them when n covers the pool
    for (int trial = 0; trial < 100; ++trial) {
        auto picks = encounter.choose_targets(party[0], 3);
        assert(picks.size() == 3);
        std::sort(picks.begin(), picks.end());
        assert(std::adjacent_find(picks.begin(), picks.end()) == picks.end());
        for (Combatant* p : picks) assert(p->is_conscious());
    }
    assert(encounter.choose_targets(party[0], 10).size() == 4);

    // With replacement the same foe can come up repeatedly
    assert(encounter.choose_targets(party[0], 10, TargetFilter::foes(), true).size() == 10);

    // Nothing left to pick
    TargetFilter undead = TargetFilter::foes();
    undead.undead_only = true;
    assert(encounter.choose_target(party[0], undead) == nullptr);
    assert(encounter.choose_targets(party[0], 2, undead).empty());
    std::cout << "[PASS] test_target_choice" << std::endl;
}

int main() {
    std::cout << "=== Encounter Tests ===" << std::endl;

    test_target_filter();
    test_party_victory();
    test_party_defeat();
    test_simultaneous_defeat();
    test_round_limit();
    test_option_groups_and_slots();
    test_down_combatants_skip_turns();
    test_turn_housekeeping();
    test_target_choice();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
