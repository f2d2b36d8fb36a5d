#pragma once

#include "core/types.hpp"

namespace d20 {

class Combatant;

// ==============================================================================
// Duration - A timed or triggered effect held in the bearer's condition set
// ==============================================================================

enum class DurationKind : u8 {
    Blessed = 0,        // +d4 to attacks and saves while the caster concentrates
    SpiritGuardians,    // Radiant WIS half-save at the start of the bearer's turn
    GuidingBolt,        // Next attack against the bearer has advantage
    AcidArrow,          // Acid damage at the end of the bearer's next turn
    Turned,             // Bearer cannot act until damaged or the timer runs out
    Paralyzed,          // Incapacitated, repeat save at the end of each turn
    SpiritualWeapon,    // Caster's floating weapon, attacks with a bonus action

    COUNT
};

enum class TurnBoundary : u8 {
    StartOfTurn = 0,
    EndOfTurn   = 1
};

inline constexpr std::string_view to_string(DurationKind k) {
    switch (k) {
        case DurationKind::Blessed:         return "blessed";
        case DurationKind::SpiritGuardians: return "spirit guardians";
        case DurationKind::GuidingBolt:     return "guiding bolt";
        case DurationKind::AcidArrow:       return "acid arrow";
        case DurationKind::Turned:          return "turned";
        case DurationKind::Paralyzed:       return "paralyzed";
        case DurationKind::SpiritualWeapon: return "spiritual weapon";
        default: return "?";
    }
}

constexpr i16 UNTIL_END_OF_ENCOUNTER = -1;

struct Duration {
    DurationKind kind = DurationKind::Blessed;
    Combatant* source = nullptr;    // Who created it
    Combatant* anchor = nullptr;    // Whose turn boundary advances the counter
    TurnBoundary tick_at = TurnBoundary::StartOfTurn;
    i16 rounds_remaining = UNTIL_END_OF_ENCOUNTER;

    u8 slot = 0;                    // Spell slot level it was cast with
    Ability escape_save = Ability::Con;
    u8 escape_dc = 0;               // Bearer saves at the end of its turn, 0 = no save

    u32 id = 0;                     // Unique within the bearer's condition set

    bool has_counter() const { return rounds_remaining != UNTIL_END_OF_ENCOUNTER; }
    bool has_escape_save() const { return escape_dc > 0; }
};

} // namespace d20
