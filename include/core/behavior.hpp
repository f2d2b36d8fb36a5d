#pragma once

#include "core/types.hpp"
#include <span>

namespace d20 {

class Combatant;
class Encounter;
class DiceRoller;

// ==============================================================================
// Behavior - The capability contract every combatant carries by value.
// Implementations are plain tables of function pointers selected by name from
// the catalog registry; there is no class hierarchy.
// ==============================================================================

enum class Archetype : u8 {
    // Player characters
    Cleric = 0,
    Fighter,
    Rogue,
    Wizard,

    // Monsters
    Bandit,
    GiantRat,
    Kobold,
    Goblin,
    Wolf,
    Zombie,
    Orc,
    Hobgoblin,
    Gnoll,
    Ghoul,
    Ogre,
    Test,

    // Scripted combatants assembled directly by callers
    Custom,

    COUNT
};

using TurnPredicate = bool (*)(const Combatant& self, const Encounter& encounter);
using TurnAction    = void (*)(Combatant& self, Encounter& encounter);
using EncounterHook = void (*)(Combatant& self, Encounter& encounter);
using RestHook      = void (*)(Combatant& self, DiceRoller& dice);

// One candidate action of a priority list. Options are evaluated top-down each
// turn; an option runs when its turn slot is unspent and its predicate holds.
// Options sharing a nonzero group are alternatives: once one of them runs, the
// rest of the group is skipped for the turn.
struct ActionOption {
    const char* name = "";
    TurnSlot slot = TurnSlot::Action;
    TurnPredicate available = nullptr;
    TurnAction execute = nullptr;
    u8 group = 0;
};

struct Behavior {
    Archetype archetype = Archetype::Custom;
    std::span<const ActionOption> options{};

    EncounterHook start_encounter = nullptr;
    EncounterHook end_encounter   = nullptr;
    RestHook short_rest           = nullptr;
    RestHook long_rest            = nullptr;
};

} // namespace d20
