#pragma once

#include "core/types.hpp"
#include "core/weapon.hpp"
#include "core/duration.hpp"
#include "core/behavior.hpp"
#include <array>
#include <algorithm>
#include <optional>
#include <vector>

namespace d20 {

// ==============================================================================
// Limited-use resources
// ==============================================================================

constexpr size_t RESOURCE_COUNT = static_cast<size_t>(ResourceId::COUNT);

struct ResourcePool {
    u8 remaining = 0;
    u8 maximum   = 0;

    bool available() const { return remaining > 0; }

    bool spend() {
        if (remaining == 0) return false;
        --remaining;
        return true;
    }

    void refill() { remaining = maximum; }
};

// Per-resource rationing state. The schedule itself is rebuilt by the
// scheduler at every encounter start; only the resulting reserve is kept.
struct Ration {
    bool enabled          = false;
    RationPolicy policy   = RationPolicy::BackLoaded;
    RestKind interval     = RestKind::Short;
    u8  budget            = 0;   // Uses the schedule spreads over the interval
    i16 reserve           = 0;   // Uses that should still remain after this encounter
};

// A concentration spell keeps one kind of condition alive on its targets
struct Concentration {
    DurationKind effect = DurationKind::Blessed;
    i16 rounds_remaining = 0;
    std::vector<Combatant*> targets;
};

// Passive features consulted by action resolution
struct Features {
    bool war_caster         = false;
    bool heavy_armor_master = false;
    bool evasion            = false;
    bool uncanny_dodge      = false;
    bool undead_fortitude   = false;
    bool disciple_of_life   = false;
    bool blessed_healer     = false;
    bool potent_cantrip     = false;
    bool pack_tactics       = false;
    bool martial_advantage  = false;
    bool paralysis_immune   = false;
    bool assassinate        = false;
    bool cunning_action     = false;
    bool nimble_escape      = false;
    bool rampage            = false;
    bool sneak_attack       = false;
};

constexpr f32 NOT_UNDEAD = -1.0f;

inline constexpr u8 ability_bit(Ability a) { return u8(1) << static_cast<u8>(a); }
inline constexpr u8 skill_bit(Skill s) { return u8(1) << static_cast<u8>(s); }

// ==============================================================================
// Combatant - A participant in combat, player character or monster
// ==============================================================================

class Combatant {
public:
    // Identity
    Name name;
    Team team  = Team::Monsters;
    u8 level   = 0;       // Class level for player characters, 0 for monsters
    u8 index   = 0;       // Position on its side, used in trace output

    // Statistics
    std::array<i8, ABILITY_COUNT> abilities{};
    ArmorType armor_type   = ArmorType::None;
    u8 base_armor_class    = 10;
    u8 proficiency         = 2;
    u8 crit_threshold      = 20;
    i8 initiative_bonus    = 0;
    Ability spell_ability  = Ability::Wis;
    i8 spell_attack_extra  = 0;
    u8 cantrip_dice        = 1;
    u8 attacks_per_action  = 1;
    u8 save_proficiencies  = 0;
    u8 skill_proficiencies = 0;
    u8 skill_expertise     = 0;
    i8 perception_bonus    = 0;   // Advantage on Perception counts as +5 passive

    Dice hit_die{1, 8};
    u8 hit_dice_total     = 0;
    u8 hit_dice_remaining = 0;

    DamageMask immunities      = 0;
    DamageMask resistances     = 0;
    DamageMask vulnerabilities = 0;
    bool construct  = false;
    f32  undead_cr  = NOT_UNDEAD;
    f32  destroy_undead_cr = NOT_UNDEAD;   // Turned undead at or below this CR are destroyed
    Features features;

    std::vector<Weapon> weapons;   // weapons[0] is the main attack

    // Vitals
    i32 hp          = 0;
    i32 max_hp      = 0;
    i32 base_max_hp = 0;

    // Resources
    std::array<ResourcePool, RESOURCE_COUNT> resources{};
    std::array<ResourcePool, MAX_SPELL_LEVEL> spell_slots{};
    std::array<Ration, RESOURCE_COUNT> resource_rations{};
    Ration slot_ration;

    // Turn economy and transient state
    bool action       = false;
    bool bonus_action = false;
    bool reaction     = false;
    bool prone        = false;
    bool surprised    = true;
    bool death_ward   = false;
    bool aided        = false;
    bool sneak_attack_available = true;
    i32  stealth      = 0;
    std::optional<Concentration> concentration;
    std::vector<Duration> conditions;
    u32 next_condition_id = 1;

    Behavior behavior;

    Combatant() = default;

    Combatant(std::string_view combatant_name, Team side)
        : name(combatant_name), team(side) {}

    // ---- Statistics -----------------------------------------------------------

    i8 modifier(Ability a) const { return abilities[static_cast<u8>(a)]; }

    i32 armor_class() const {
        switch (armor_type) {
            case ArmorType::Heavy:  return base_armor_class;
            case ArmorType::Medium: return base_armor_class + std::min<i32>(2, modifier(Ability::Dex));
            default:                return base_armor_class + modifier(Ability::Dex);
        }
    }

    bool proficient_save(Ability a) const { return (save_proficiencies & ability_bit(a)) != 0; }
    bool proficient_skill(Skill s) const { return (skill_proficiencies & skill_bit(s)) != 0; }

    i32 skill_modifier(Skill s, Ability a) const {
        i32 mod = modifier(a);
        if (proficient_skill(s)) mod += proficiency;
        if ((skill_expertise & skill_bit(s)) != 0) mod += proficiency;
        return mod;
    }

    i32 passive_perception() const {
        return 10 + skill_modifier(Skill::Perception, Ability::Wis) + perception_bonus;
    }

    bool is_hidden_from(const Combatant& observer) const {
        return stealth > observer.passive_perception();
    }

    i32 spell_save_dc() const { return 8 + proficiency + modifier(spell_ability); }
    i32 spell_attack_bonus() const { return proficiency + modifier(spell_ability) + spell_attack_extra; }

    bool is_undead() const { return undead_cr >= 0.0f; }
    bool immune_to(DamageType t) const { return (immunities & damage_bit(t)) != 0; }
    bool resists(DamageType t) const { return (resistances & damage_bit(t)) != 0; }
    bool vulnerable_to(DamageType t) const { return (vulnerabilities & damage_bit(t)) != 0; }

    // ---- Hit points -----------------------------------------------------------

    bool is_conscious() const { return hp > 0; }
    bool is_down() const { return hp <= 0 && max_hp > 0; }      // Unconscious, can be revived
    bool is_destroyed() const { return max_hp <= 0; }
    bool is_wounded() const { return hp < max_hp; }
    bool is_incapacitated() const { return has_condition(DurationKind::Paralyzed); }
    bool is_turned() const { return has_condition(DurationKind::Turned); }

    // ---- Resources ------------------------------------------------------------

    ResourcePool& resource(ResourceId id) { return resources[static_cast<u8>(id)]; }
    const ResourcePool& resource(ResourceId id) const { return resources[static_cast<u8>(id)]; }
    Ration& ration(ResourceId id) { return resource_rations[static_cast<u8>(id)]; }
    const Ration& ration(ResourceId id) const { return resource_rations[static_cast<u8>(id)]; }

    // Whether spending one more use stays within this encounter's allotment
    bool within_ration(ResourceId id) const {
        const Ration& r = ration(id);
        if (!r.enabled) return resource(id).available();
        return resource(id).remaining > r.reserve;
    }

    bool within_slot_ration() const {
        if (!slot_ration.enabled) return spell_slots_remaining() > 0;
        return static_cast<i32>(spell_slots_remaining()) > slot_ration.reserve;
    }

    u32 spell_slots_remaining() const {
        u32 total = 0;
        for (const auto& s : spell_slots) total += s.remaining;
        return total;
    }

    u32 spell_slots_total() const {
        u32 total = 0;
        for (const auto& s : spell_slots) total += s.maximum;
        return total;
    }

    u8 slot_count(u8 slot_level) const {
        if (slot_level == 0 || slot_level > MAX_SPELL_LEVEL) return 0;
        return spell_slots[slot_level - 1].remaining;
    }

    // Cheapest slot able to cast a spell of the given level
    std::optional<u8> lowest_slot_at_or_above(u8 spell_level) const {
        for (u8 s = std::max<u8>(spell_level, 1); s <= MAX_SPELL_LEVEL; ++s) {
            if (spell_slots[s - 1].remaining > 0) return s;
        }
        return std::nullopt;
    }

    bool spend_slot(u8 slot_level) {
        if (slot_level == 0 || slot_level > MAX_SPELL_LEVEL) return false;
        return spell_slots[slot_level - 1].spend();
    }

    void set_spell_slots(std::initializer_list<u8> per_level) {
        u8 level_index = 0;
        for (u8 count : per_level) {
            if (level_index >= MAX_SPELL_LEVEL) break;
            spell_slots[level_index].maximum = count;
            spell_slots[level_index].remaining = count;
            ++level_index;
        }
    }

    // ---- Conditions -----------------------------------------------------------

    u32 add_condition(Duration d) {
        d.id = next_condition_id++;
        conditions.push_back(d);
        return d.id;
    }

    bool has_condition(DurationKind kind) const {
        return std::any_of(conditions.begin(), conditions.end(),
                           [kind](const Duration& d) { return d.kind == kind; });
    }

    Duration* find_condition(DurationKind kind, const Combatant* source = nullptr) {
        for (auto& d : conditions) {
            if (d.kind == kind && (source == nullptr || d.source == source)) return &d;
        }
        return nullptr;
    }

    Duration* find_condition_by_id(u32 id) {
        for (auto& d : conditions) {
            if (d.id == id) return &d;
        }
        return nullptr;
    }

    void remove_condition(u32 id) {
        std::erase_if(conditions, [id](const Duration& d) { return d.id == id; });
    }

    void remove_conditions(DurationKind kind, const Combatant* source = nullptr) {
        std::erase_if(conditions, [kind, source](const Duration& d) {
            return d.kind == kind && (source == nullptr || d.source == source);
        });
    }

    void end_concentration() {
        if (!concentration) return;
        Concentration ended = std::move(*concentration);
        concentration.reset();
        for (Combatant* target : ended.targets) {
            target->remove_conditions(ended.effect, this);
        }
    }

    // ---- Lifecycle ------------------------------------------------------------

    // Clears everything that does not survive an encounter boundary
    void reset_conditions() {
        action = bonus_action = reaction = false;
        prone = false;
        surprised = true;
        sneak_attack_available = true;
        stealth = 0;
        concentration.reset();
        conditions.clear();
    }

    void reset_hp() {
        aided = false;
        max_hp = base_max_hp;
        hp = max_hp;
    }

    void refill_resources(RestKind rest) {
        for (size_t i = 0; i < RESOURCE_COUNT; ++i) {
            if (rest == RestKind::Long || resource_rations[i].interval == RestKind::Short) {
                resources[i].refill();
            }
        }
        if (rest == RestKind::Long) {
            for (auto& s : spell_slots) s.refill();
        }
    }

    // Turn economy at the start of the combatant's own turn
    void begin_turn() {
        surprised = false;
        bonus_action = true;
        sneak_attack_available = true;
        if (!is_turned()) {
            action = true;
            reaction = true;
        }
    }
};

} // namespace d20
