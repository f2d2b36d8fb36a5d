#pragma once

#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace d20 {

// ==============================================================================
// Fundamental Types
// ==============================================================================

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;

// Maximum counts (compile-time constants)
constexpr size_t ABILITY_COUNT      = 6;
constexpr size_t MAX_SPELL_LEVEL    = 9;
constexpr size_t MAX_PARTY_SIZE     = 16;
constexpr size_t MAX_MONSTER_COUNT  = 64;
constexpr size_t MAX_NAME_LENGTH    = 32;

constexpr u8 MIN_PARTY_LEVEL = 1;
constexpr u8 MAX_PARTY_LEVEL = 8;

// ==============================================================================
// Enumerations
// ==============================================================================

enum class Ability : u8 {
    Str = 0,
    Dex = 1,
    Con = 2,
    Int = 3,
    Wis = 4,
    Cha = 5,

    COUNT
};

enum class Team : u8 {
    Party    = 0,
    Monsters = 1
};

enum class ArmorType : u8 {
    None   = 0,
    Light  = 1,
    Medium = 2,
    Heavy  = 3
};

enum class AttackOutcome : u8 {
    Miss = 0,
    Hit  = 1,
    Crit = 2
};

enum class Skill : u8 {
    Perception = 0,
    Stealth    = 1,

    COUNT
};

// Damage types. The magic physical variants bypass resistance and immunity to
// their mundane counterpart.
enum class DamageType : u8 {
    Acid = 0,
    Bludgeoning,
    Cold,
    Fire,
    Force,
    Lightning,
    Necrotic,
    Piercing,
    Poison,
    Psychic,
    Radiant,
    Slashing,
    Thunder,
    MagicBludgeoning,
    MagicPiercing,
    MagicSlashing,

    COUNT
};

using DamageMask = u32;

inline constexpr DamageMask damage_bit(DamageType t) {
    return DamageMask(1) << static_cast<u8>(t);
}

static_assert(static_cast<int>(DamageType::COUNT) <= 32, "DamageMask requires COUNT <= 32");

inline constexpr bool is_physical(DamageType t) {
    return t == DamageType::Bludgeoning || t == DamageType::Piercing || t == DamageType::Slashing
        || t == DamageType::MagicBludgeoning || t == DamageType::MagicPiercing
        || t == DamageType::MagicSlashing;
}

// Limited-use class features (spell slots are tracked separately)
enum class ResourceId : u8 {
    ChannelDivinity = 0,
    ActionSurge     = 1,
    SecondWind      = 2,
    ArcaneRecovery  = 3,

    COUNT
};

// Which end of a rest interval receives the uneven remainder of a ration
enum class RationPolicy : u8 {
    FrontLoaded = 0,
    BackLoaded  = 1
};

enum class RestKind : u8 {
    Short = 0,
    Long  = 1
};

// Turn economy slot an action option consumes
enum class TurnSlot : u8 {
    Action      = 0,
    BonusAction = 1,
    Reaction    = 2,
    Free        = 3
};

// ==============================================================================
// Dice Expression - NdS with optional reroll-once-at-or-below
// ==============================================================================

struct Dice {
    u8 count = 0;
    u8 sides = 0;
    u8 reroll_at_most = 0;  // Great Weapon Fighting style reroll, 0 = none

    constexpr Dice() = default;
    constexpr Dice(u8 n, u8 s, u8 reroll = 0) : count(n), sides(s), reroll_at_most(reroll) {}

    constexpr bool empty() const { return count == 0 || sides == 0; }
    constexpr Dice times(u8 k) const { return Dice(static_cast<u8>(count * k), sides, reroll_at_most); }
    constexpr Dice plus(u8 n) const { return Dice(static_cast<u8>(count + n), sides, reroll_at_most); }
    constexpr f64 average() const { return count * (sides + 1) / 2.0; }
};

// ==============================================================================
// Names
// ==============================================================================

inline constexpr std::string_view to_string(Ability a) {
    switch (a) {
        case Ability::Str: return "STR";
        case Ability::Dex: return "DEX";
        case Ability::Con: return "CON";
        case Ability::Int: return "INT";
        case Ability::Wis: return "WIS";
        case Ability::Cha: return "CHA";
        default: return "?";
    }
}

inline constexpr std::string_view to_string(DamageType t) {
    switch (t) {
        case DamageType::Acid:             return "acid";
        case DamageType::Bludgeoning:      return "bludgeoning";
        case DamageType::Cold:             return "cold";
        case DamageType::Fire:             return "fire";
        case DamageType::Force:            return "force";
        case DamageType::Lightning:        return "lightning";
        case DamageType::Necrotic:         return "necrotic";
        case DamageType::Piercing:         return "piercing";
        case DamageType::Poison:           return "poison";
        case DamageType::Psychic:          return "psychic";
        case DamageType::Radiant:          return "radiant";
        case DamageType::Slashing:         return "slashing";
        case DamageType::Thunder:          return "thunder";
        case DamageType::MagicBludgeoning: return "magic bludgeoning";
        case DamageType::MagicPiercing:    return "magic piercing";
        case DamageType::MagicSlashing:    return "magic slashing";
        default: return "?";
    }
}

inline constexpr std::string_view to_string(AttackOutcome o) {
    switch (o) {
        case AttackOutcome::Miss: return "miss";
        case AttackOutcome::Hit:  return "hit";
        case AttackOutcome::Crit: return "critical hit";
        default: return "?";
    }
}

// ==============================================================================
// Fixed-Size String (avoids heap allocation)
// ==============================================================================

template<size_t N>
struct FixedString {
    std::array<char, N> data{};
    u8 length = 0;

    FixedString() = default;

    FixedString(std::string_view sv) {
        length = static_cast<u8>(std::min(sv.size(), N - 1));
        std::copy_n(sv.begin(), length, data.begin());
        data[length] = '\0';
    }

    std::string_view view() const { return {data.data(), length}; }
    const char* c_str() const { return data.data(); }
    bool empty() const { return length == 0; }
    bool operator==(std::string_view other) const { return view() == other; }
};

using Name = FixedString<MAX_NAME_LENGTH>;

} // namespace d20
