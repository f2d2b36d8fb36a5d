#include "catalog/bestiary.hpp"
#include "catalog/tactics.hpp"
#include "engine/encounter.hpp"
#include <algorithm>
#include <string>

namespace d20 {

namespace {

Combatant new_monster(std::string_view name, std::array<i8, ABILITY_COUNT> abilities, u8 armor_class,
                      ArmorType armor, Dice hit_dice, DiceRoller& dice) {
    Combatant c(name, Team::Monsters);
    c.abilities = abilities;
    c.base_armor_class = armor_class;
    c.armor_type = armor;
    c.proficiency = 2;
    c.hit_die = Dice(1, hit_dice.sides);
    c.hit_dice_total = hit_dice.count;
    c.hit_dice_remaining = hit_dice.count;
    c.base_max_hp = roll_monster_hp(hit_dice, c.modifier(Ability::Con), dice);
    c.reset_hp();
    return c;
}

// ==============================================================================
// Turn options
// ==============================================================================

// Main weapon attacks on random conscious foes, with Pack Tactics and
// Martial Advantage when an ally is up. Gnolls follow a kill with a bite.
void attack(Combatant& self, Encounter& encounter) {
    self.action = false;
    ActionResolver& resolver = encounter.resolver();

    for (u8 i = 0; i < self.attacks_per_action; ++i) {
        if (!self.is_conscious()) break;
        Combatant* target = encounter.choose_target(self);
        if (target == nullptr) break;

        const bool ally = ally_nearby(self, encounter);
        AttackOptions options;
        options.advantage = self.features.pack_tactics && ally;

        const Weapon& weapon = self.weapons[0];
        if (self.features.martial_advantage && ally) {
            resolver.weapon_attack(self, *target, weapon.with_extra_dice(2, 6), options);
        } else {
            resolver.weapon_attack(self, *target, weapon, options);
        }

        if (self.features.rampage && target->is_down() && self.bonus_action && self.weapons.size() > 1) {
            self.bonus_action = false;
            if (Combatant* next = encounter.choose_target(self)) {
                resolver.weapon_attack(self, *next, self.weapons[1]);
            }
        }
    }
}

// Bite against a paralyzed target, paralyzing claws otherwise
void ghoul_attack(Combatant& self, Encounter& encounter) {
    self.action = false;
    Combatant* target = encounter.choose_target(self);
    if (target == nullptr) return;

    const Weapon& weapon = target->is_incapacitated() ? self.weapons[1] : self.weapons[0];
    encounter.resolver().weapon_attack(self, *target, weapon);
}

bool nimble_escape_ready(const Combatant& self, const Encounter&) {
    return self.features.nimble_escape;
}

const std::array<ActionOption, 1> ATTACK_OPTIONS = {{
    {"Attack", TurnSlot::Action, nullptr, attack, 0},
}};

const std::array<ActionOption, 2> GOBLIN_OPTIONS = {{
    {"Scimitar", TurnSlot::Action,      nullptr,             attack, 0},
    {"Hide",     TurnSlot::BonusAction, nimble_escape_ready, hide,   0},
}};

const std::array<ActionOption, 1> GHOUL_OPTIONS = {{
    {"Claws or Bite", TurnSlot::Action, nullptr, ghoul_attack, 0},
}};

Behavior attacker(Archetype archetype) {
    return Behavior{archetype, ATTACK_OPTIONS, nullptr, nullptr, nullptr, nullptr};
}

} // namespace

i32 roll_monster_hp(const Dice& hit_dice, i8 con, DiceRoller& dice) {
    return std::max<i32>(1, dice.roll(hit_dice) + hit_dice.count * con);
}

// ==============================================================================
// Monster Manual
// ==============================================================================

Combatant make_bandit(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Bandit", {0, 1, 1, 0, 0, 0}, 11, ArmorType::Light, Dice(2, 8), dice);
    c.skill_proficiencies = skill_bit(Skill::Perception);
    c.weapons.emplace_back("Scimitar", Dice(1, 6), DamageType::Slashing, Ability::Dex);
    c.behavior = attacker(Archetype::Bandit);
    return c;
}

Combatant make_giant_rat(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Giant rat", {-2, 2, 0, -4, 0, -3}, 10, ArmorType::None, Dice(2, 6), dice);
    c.skill_proficiencies = skill_bit(Skill::Perception);
    c.perception_bonus = 5;
    c.features.pack_tactics = true;
    c.weapons.emplace_back("Bite", Dice(1, 4), DamageType::Piercing, Ability::Dex);
    c.behavior = attacker(Archetype::GiantRat);
    return c;
}

Combatant make_kobold(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Kobold", {-2, 2, -1, -1, -2, -1}, 10, ArmorType::None, Dice(2, 6), dice);
    c.features.pack_tactics = true;
    c.weapons.emplace_back("Dagger", Dice(1, 4), DamageType::Piercing, Ability::Dex);
    c.behavior = attacker(Archetype::Kobold);
    return c;
}

Combatant make_goblin(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Goblin", {-1, 2, 0, 0, -1, -1}, 13, ArmorType::Light, Dice(2, 6), dice);
    c.skill_proficiencies = skill_bit(Skill::Stealth);
    c.skill_expertise = skill_bit(Skill::Stealth);
    c.features.nimble_escape = true;
    c.weapons.emplace_back("Scimitar", Dice(1, 6), DamageType::Slashing, Ability::Dex);
    c.behavior = Behavior{Archetype::Goblin, GOBLIN_OPTIONS, nullptr, nullptr, nullptr, nullptr};
    return c;
}

Combatant make_wolf(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Wolf", {1, 2, 1, -4, 1, -2}, 11, ArmorType::None, Dice(2, 8), dice);
    c.skill_proficiencies = skill_bit(Skill::Perception) | skill_bit(Skill::Stealth);
    c.perception_bonus = 5;
    c.features.pack_tactics = true;
    c.weapons.push_back(Weapon("Bite", Dice(2, 4), DamageType::Piercing).with_rider(OnHitEffect::Prone, Ability::Str, 11));
    c.behavior = attacker(Archetype::Wolf);
    return c;
}

Combatant make_zombie(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Zombie", {1, -2, 3, -4, -2, -3}, 10, ArmorType::None, Dice(3, 8), dice);
    c.save_proficiencies = ability_bit(Ability::Wis);
    c.immunities = damage_bit(DamageType::Poison);
    c.undead_cr = 0.25f;
    c.features.undead_fortitude = true;
    c.weapons.emplace_back("Slam", Dice(1, 6), DamageType::Bludgeoning);
    c.behavior = attacker(Archetype::Zombie);
    return c;
}

Combatant make_orc(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Orc", {3, 1, 3, -2, 0, 0}, 12, ArmorType::Medium, Dice(2, 8), dice);
    c.weapons.emplace_back("Greataxe", Dice(1, 12), DamageType::Slashing);
    c.behavior = attacker(Archetype::Orc);
    return c;
}

Combatant make_hobgoblin(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Hobgoblin", {1, 1, 1, 0, 0, -1}, 17, ArmorType::Medium, Dice(2, 8), dice);
    c.features.martial_advantage = true;
    c.weapons.emplace_back("Longsword", Dice(1, 8), DamageType::Slashing);
    c.behavior = attacker(Archetype::Hobgoblin);
    return c;
}

Combatant make_gnoll(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Gnoll", {2, 1, 0, -2, 0, -2}, 14, ArmorType::Light, Dice(5, 8), dice);
    c.features.rampage = true;
    c.weapons.emplace_back("Spear", Dice(1, 6), DamageType::Piercing);
    c.weapons.emplace_back("Bite", Dice(1, 4), DamageType::Piercing);
    c.behavior = attacker(Archetype::Gnoll);
    return c;
}

Combatant make_ghoul(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Ghoul", {1, 2, 0, -2, 0, -2}, 10, ArmorType::None, Dice(5, 8), dice);
    c.immunities = damage_bit(DamageType::Poison);
    c.undead_cr = 1.0f;

    const i32 dc = 8 + c.proficiency + c.modifier(Ability::Con);
    c.weapons.push_back(Weapon("Claws", Dice(2, 4), DamageType::Slashing, Ability::Dex)
                            .with_rider(OnHitEffect::Paralyze, Ability::Con, static_cast<u8>(dc)));
    Weapon bite("Bite", Dice(2, 6), DamageType::Piercing, Ability::Dex);
    bite.proficient = false;
    c.weapons.push_back(bite);

    c.behavior = Behavior{Archetype::Ghoul, GHOUL_OPTIONS, nullptr, nullptr, nullptr, nullptr};
    return c;
}

Combatant make_ogre(const CombatantParams&, DiceRoller& dice) {
    Combatant c = new_monster("Ogre", {4, -1, 3, -3, -2, -2}, 12, ArmorType::Medium, Dice(7, 10), dice);
    c.weapons.emplace_back("Greatclub", Dice(2, 8), DamageType::Bludgeoning);
    c.behavior = attacker(Archetype::Ogre);
    return c;
}

// ==============================================================================
// Test creature
// Damage and hit points are matched by dice expressions: every 7 points of
// damage per attack is 2d6 and every 9 hit points is 2d8, the rest a flat
// modifier in [-2, 4] or [-2, 6].
// ==============================================================================

Combatant make_test_creature(const CombatantParams& params, DiceRoller& dice) {
    const TestStats& s = params.test;

    Combatant c("Test", Team::Monsters);
    c.armor_type = ArmorType::None;
    c.base_armor_class = static_cast<u8>(std::clamp(s.armor_class, 0, 255));
    c.proficiency = static_cast<u8>(std::clamp(s.proficiency, 0, 255));
    c.save_proficiencies = ability_bit(Ability::Dex) | ability_bit(Ability::Con) | ability_bit(Ability::Wis);
    c.skill_proficiencies = skill_bit(Skill::Perception);
    c.attacks_per_action = static_cast<u8>(std::clamp(s.attacks, 1, 255));

    const i32 per_attack = s.damage / std::max(1, s.attacks);
    Weapon weapon("Attack", Dice(static_cast<u8>(std::clamp(2 * ((per_attack + 2) / 7), 0, 255)), 6),
                  DamageType::Bludgeoning);
    weapon.attack_modifier = static_cast<i8>(s.attack - s.proficiency);
    weapon.damage_modifier = static_cast<i8>((per_attack + 2) % 7 - 2);
    c.weapons.push_back(weapon);

    const Dice hit_dice(static_cast<u8>(std::clamp(2 * ((s.hit_points + 2) / 9), 0, 255)), 8);
    c.hit_die = Dice(1, 8);
    c.hit_dice_total = hit_dice.count;
    c.hit_dice_remaining = hit_dice.count;
    c.base_max_hp = std::max<i32>(1, dice.roll(hit_dice) + (s.hit_points + 2) % 9 - 2);
    c.reset_hp();

    c.behavior = attacker(Archetype::Test);
    return c;
}

// Dice counts are a u8, so at most 127 pairs of d6 or d8
constexpr i32 MAX_TEST_DICE_PAIRS = 127;
constexpr i32 MAX_TEST_DAMAGE_PER_ATTACK = MAX_TEST_DICE_PAIRS * 7 + 6 - 2;
constexpr i32 MAX_TEST_HIT_POINTS = MAX_TEST_DICE_PAIRS * 9 + 8 - 2;

std::vector<std::string> test_stats_problems(const TestStats& s) {
    std::vector<std::string> problems;
    auto check = [&](const char* what, i64 value, i64 lo, i64 hi) {
        if (value < lo || value > hi) {
            problems.push_back("Test " + std::string(what) + " " + std::to_string(value) + " is outside "
                               + std::to_string(lo) + ".." + std::to_string(hi));
        }
    };

    check("armor class", s.armor_class, 0, 255);
    check("attacks per round", s.attacks, 1, 255);
    check("proficiency", s.proficiency, 0, 255);
    check("attack bonus without proficiency", static_cast<i64>(s.attack) - s.proficiency, -128, 127);
    check("damage per attack", s.damage / std::max(1, s.attacks), 0, MAX_TEST_DAMAGE_PER_ATTACK);
    check("hit points", s.hit_points, 1, MAX_TEST_HIT_POINTS);
    return problems;
}

std::string test_creature_label(const TestStats& s) {
    return "Test(" + std::to_string(s.attack) + "," + std::to_string(s.armor_class) + ","
         + std::to_string(s.damage) + "," + std::to_string(s.hit_points) + ","
         + std::to_string(s.attacks) + "," + std::to_string(s.proficiency) + ")";
}

void register_bestiary(CombatantRegistry& registry) {
    registry.register_entry("Bandit", Team::Monsters, make_bandit);
    registry.register_entry("Giant rat", Team::Monsters, make_giant_rat);
    registry.register_entry("Kobold", Team::Monsters, make_kobold);
    registry.register_entry("Goblin", Team::Monsters, make_goblin);
    registry.register_entry("Wolf", Team::Monsters, make_wolf);
    registry.register_entry("Zombie", Team::Monsters, make_zombie);
    registry.register_entry("Orc", Team::Monsters, make_orc);
    registry.register_entry("Hobgoblin", Team::Monsters, make_hobgoblin);
    registry.register_entry("Gnoll", Team::Monsters, make_gnoll);
    registry.register_entry("Ghoul", Team::Monsters, make_ghoul);
    registry.register_entry("Ogre", Team::Monsters, make_ogre);
    registry.register_entry("Test", Team::Monsters, make_test_creature);
}

} // namespace d20
