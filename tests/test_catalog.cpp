#include "catalog/bestiary.hpp"
#include "catalog/party.hpp"
#include "catalog/registry.hpp"
#include "engine/rest.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

using namespace d20;

Combatant build(const std::string& name, u8 level, DiceRoller& dice) {
    const CatalogEntry* entry = get_combatant_registry().find(name);
    assert(entry != nullptr);
    CombatantParams params;
    params.level = level;
    return entry->create(params, dice);
}

void test_concurrent_initialization() {
    std::vector<std::thread> threads;
    std::vector<int> found(8, 0);
    for (size_t t = 0; t < found.size(); ++t) {
        threads.emplace_back([&found, t]() {
            initialize_catalog();
            found[t] = get_combatant_registry().find("Kobold") != nullptr ? 1 : 0;
        });
    }
    for (auto& thread : threads) thread.join();

    for (int f : found) assert(f == 1);
    assert(get_combatant_registry().size() == 16);
    assert(get_combatant_registry().names(Team::Party).size() == 4);
    std::cout << "[PASS] test_concurrent_initialization" << std::endl;
}

void test_registry_contents() {
    initialize_catalog();
    auto& registry = get_combatant_registry();
    const size_t size = registry.size();

    // Repeated initialization changes nothing
    initialize_catalog();
    assert(registry.size() == size);
    assert(registry.is_initialized());

    assert((registry.names(Team::Party) == std::vector<std::string>{"Cleric", "Fighter", "Rogue", "Wizard"}));
    assert((registry.names(Team::Monsters) == std::vector<std::string>{
        "Bandit", "Giant rat", "Kobold", "Goblin", "Wolf", "Zombie",
        "Orc", "Hobgoblin", "Gnoll", "Ghoul", "Ogre", "Test"}));

    // Lookups are case-sensitive and side-aware
    assert(registry.find("Kobold") != nullptr);
    assert(registry.find("kobold") == nullptr);
    assert(registry.find("Giant Rat") == nullptr);
    assert(registry.find("Kobold", Team::Party) == nullptr);
    assert(registry.find("Wizard", Team::Party) != nullptr);
    std::cout << "[PASS] test_registry_contents" << std::endl;
}

void test_first_level_party() {
    DiceRoller dice(1);

    Combatant cleric = build("Cleric", 1, dice);
    assert(cleric.team == Team::Party);
    assert(cleric.max_hp == 10 && cleric.hp == 10);
    assert(cleric.armor_class() == 18);
    assert(cleric.slot_count(1) == 2);
    assert(cleric.spell_save_dc() == 13);
    assert(!cleric.death_ward);

    Combatant fighter = build("Fighter", 1, dice);
    assert(fighter.max_hp == 13);
    assert(fighter.armor_class() == 16);
    assert(fighter.crit_threshold == 20);
    assert(fighter.attacks_per_action == 1);
    assert(fighter.resource(ResourceId::SecondWind).remaining == 1);
    assert(fighter.resource(ResourceId::ActionSurge).maximum == 0);

    Combatant rogue = build("Rogue", 1, dice);
    assert(rogue.max_hp == 10);
    assert(rogue.armor_class() == 14);
    assert(rogue.features.sneak_attack);
    assert(!rogue.features.cunning_action);

    // Mage Armor already took one of the two first-level slots
    Combatant wizard = build("Wizard", 1, dice);
    assert(wizard.max_hp == 8);
    assert(wizard.armor_class() == 15);
    assert(wizard.spell_slots_total() == 2);
    assert(wizard.spell_slots_remaining() == 1);
    std::cout << "[PASS] test_first_level_party" << std::endl;
}

void test_party_progression() {
    DiceRoller dice(2);

    Combatant fighter = build("Fighter", 5, dice);
    assert(fighter.armor_class() == 18);
    assert(fighter.attacks_per_action == 2);
    assert(fighter.crit_threshold == 19);
    assert(fighter.features.heavy_armor_master);

    Combatant fighter6 = build("Fighter", 6, dice);
    assert(fighter6.max_hp == 64);
    assert(fighter6.weapons[0].damage_type == DamageType::MagicSlashing);

    Combatant wizard = build("Wizard", 5, dice);
    assert(wizard.slot_count(1) == 3);
    assert(wizard.slot_count(2) == 3);
    assert(wizard.slot_count(3) == 2);
    assert(wizard.cantrip_dice == 2);

    Combatant rogue = build("Rogue", 7, dice);
    assert(rogue.features.uncanny_dodge && rogue.features.evasion && rogue.features.assassinate);
    assert(rogue.weapons.size() == 2);

    // Death Ward is cast with the only 4th-level slot
    Combatant cleric = build("Cleric", 7, dice);
    assert(cleric.death_ward);
    assert(cleric.slot_count(4) == 0);
    assert(cleric.destroy_undead_cr == 0.5f);

    Combatant cleric8 = build("Cleric", 8, dice);
    assert(cleric8.spell_save_dc() == 15);
    assert(cleric8.death_ward && cleric8.slot_count(4) == 1);
    assert(cleric8.weapons[0].has_secondary());
    std::cout << "[PASS] test_party_progression" << std::endl;
}

void test_full_caster_table() {
    for (u8 level = MIN_PARTY_LEVEL; level <= MAX_PARTY_LEVEL; ++level) {
        auto slots = full_caster_slots(level);
        u32 total = 0;
        for (u8 s : slots) total += s;
        assert(total >= 2);
        for (size_t i = 5; i < MAX_SPELL_LEVEL; ++i) assert(slots[i] == 0);
    }
    assert(full_caster_slots(3)[1] == 2);
    assert(full_caster_slots(7)[3] == 1);
    assert(proficiency_for_level(4) == 2);
    assert(proficiency_for_level(5) == 3);
    std::cout << "[PASS] test_full_caster_table" << std::endl;
}

void test_class_rest_hooks() {
    DiceRoller dice(3);

    // Arcane Recovery buys back slots worth half the wizard level
    Combatant wizard = build("Wizard", 5, dice);
    for (u8 s = 1; s <= 3; ++s) {
        while (wizard.spend_slot(s)) {
        }
    }
    take_short_rest(wizard, dice);
    assert(wizard.slot_count(3) == 1);
    assert(wizard.spell_slots_remaining() == 1);
    assert(wizard.resource(ResourceId::ArcaneRecovery).remaining == 0);

    take_short_rest(wizard, dice);
    assert(wizard.spell_slots_remaining() == 1);

    // Second Wind on the rest when wounded, refilled afterwards
    Combatant fighter = build("Fighter", 3, dice);
    fighter.hp = 5;
    take_short_rest(fighter, dice);
    assert(fighter.hp > 5);
    assert(fighter.resource(ResourceId::SecondWind).remaining == 1);

    take_long_rest(wizard, dice);
    assert(wizard.resource(ResourceId::ArcaneRecovery).remaining == 1);
    assert(wizard.slot_count(1) == 3);
    std::cout << "[PASS] test_class_rest_hooks" << std::endl;
}

void test_bestiary_statistics() {
    DiceRoller dice(4);

    struct Expected {
        const char* name;
        i32 armor_class;
        i32 min_hp;
        i32 max_hp;
    };
    const Expected table[] = {
        {"Bandit", 12, 4, 18},
        {"Giant rat", 12, 2, 12},
        {"Kobold", 12, 1, 10},
        {"Goblin", 15, 2, 12},
        {"Wolf", 13, 4, 18},
        {"Zombie", 8, 12, 33},
        {"Orc", 13, 8, 22},
        {"Hobgoblin", 18, 4, 18},
        {"Gnoll", 15, 5, 40},
        {"Ghoul", 12, 5, 40},
        {"Ogre", 11, 28, 91},
    };

    for (const auto& row : table) {
        for (int i = 0; i < 50; ++i) {
            Combatant m = build(row.name, 1, dice);
            assert(m.team == Team::Monsters);
            assert(m.name == row.name);
            assert(m.armor_class() == row.armor_class);
            assert(m.hp >= row.min_hp && m.hp <= row.max_hp);
            assert(m.hp == m.max_hp);
            assert(!m.weapons.empty());
            assert(!m.behavior.options.empty());
        }
    }
    std::cout << "[PASS] test_bestiary_statistics" << std::endl;
}

void test_monster_traits() {
    DiceRoller dice(5);

    Combatant zombie = build("Zombie", 1, dice);
    assert(zombie.is_undead());
    assert(zombie.features.undead_fortitude);
    assert(zombie.immune_to(DamageType::Poison));

    Combatant ghoul = build("Ghoul", 1, dice);
    assert(ghoul.is_undead());
    assert(ghoul.weapons[0].on_hit == OnHitEffect::Paralyze);
    assert(ghoul.weapons[0].on_hit_dc == 10);
    assert(!ghoul.weapons[1].proficient);

    Combatant wolf = build("Wolf", 1, dice);
    assert(wolf.features.pack_tactics);
    assert(wolf.weapons[0].on_hit == OnHitEffect::Prone);
    assert(wolf.weapons[0].on_hit_dc == 11);

    assert(build("Hobgoblin", 1, dice).features.martial_advantage);
    assert(build("Gnoll", 1, dice).features.rampage);
    assert(build("Goblin", 1, dice).features.nimble_escape);
    assert(roll_monster_hp(Dice(1, 4), -5, dice) == 1);
    std::cout << "[PASS] test_monster_traits" << std::endl;
}

void test_test_creature() {
    DiceRoller dice(6);
    CombatantParams params;
    params.test = TestStats{5, 13, 10, 30, 2, 2};

    i64 hp_total = 0;
    const int iterations = 2000;
    for (int i = 0; i < iterations; ++i) {
        Combatant t = make_test_creature(params, dice);
        assert(t.armor_class() == 13);
        assert(t.attacks_per_action == 2);
        assert(t.hp >= 9 && t.hp <= 51);
        hp_total += t.hp;

        // 2d6 - 2 per attack for 10 damage over two attacks
        const Weapon& w = t.weapons[0];
        assert(w.dice.count == 2 && w.dice.sides == 6);
        assert(w.damage_modifier == -2);
        assert(w.attack_modifier + t.proficiency == 5);
    }
    assert(std::abs(static_cast<double>(hp_total) / iterations - 30.0) < 1.0);

    assert(test_creature_label(params.test) == "Test(5,13,10,30,2,2)");
    std::cout << "[PASS] test_test_creature" << std::endl;
}

int main() {
    std::cout << "=== Catalog Tests ===" << std::endl;

    test_concurrent_initialization();
    test_registry_contents();
    test_first_level_party();
    test_party_progression();
    test_full_caster_table();
    test_class_rest_hooks();
    test_bestiary_statistics();
    test_monster_traits();
    test_test_creature();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
