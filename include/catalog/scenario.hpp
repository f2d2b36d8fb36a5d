#pragma once

#include "core/types.hpp"
#include "catalog/registry.hpp"
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace d20 {

// ==============================================================================
// Configuration errors
// Raised before any day is simulated; the message lists every problem found.
// ==============================================================================

class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
    explicit ConfigError(const std::vector<std::string>& problems)
        : std::invalid_argument(join(problems)) {}

    static std::string join(const std::vector<std::string>& problems) {
        std::string text;
        for (const auto& p : problems) {
            if (!text.empty()) text += "; ";
            text += p;
        }
        return text;
    }
};

// ==============================================================================
// Scenario - The party and the monster side every encounter of a day faces
// ==============================================================================

struct MonsterGroup {
    std::string name;
    u32 count = 0;
};

struct Scenario {
    u8 party_level = 1;
    std::vector<std::string> party_classes;
    std::vector<MonsterGroup> monsters;
    TestStats test_stats{};    // Used by Test groups only

    u32 monster_total() const {
        u32 total = 0;
        for (const auto& g : monsters) total += g.count;
        return total;
    }

    // "Kobold 4", "Orc 2 Wolf 3"
    std::string label() const;

    // Problems with the scenario; empty when it can be simulated
    std::vector<std::string> validate() const;
};

inline const std::vector<std::string>& default_party_classes() {
    static const std::vector<std::string> classes = {"Cleric", "Fighter", "Rogue", "Wizard"};
    return classes;
}

// ==============================================================================
// ScenarioParser - Builds a scenario from the comma-separated CLI lists
// ==============================================================================
//
//   classes  "Cleric,Fighter,Rogue,Wizard"
//   monsters "Kobold,Wolf"
//   counts   "4,2"
//   level    "3"
//   test     "5,13,10,30,2,2"   attack, AC, damage, HP, attacks, proficiency
//

class ScenarioParser {
public:
    struct Input {
        std::string classes = "Cleric,Fighter,Rogue,Wizard";
        std::string monsters = "Kobold";
        std::string counts = "4";
        std::string level = "1";
        std::string test_stats;
    };

    struct ParseResult {
        std::optional<Scenario> scenario;
        std::vector<std::string> errors;

        bool ok() const { return scenario.has_value() && errors.empty(); }
    };

    static ParseResult parse(const Input& input);

    // Programmatic entry with already-split values. Throws ConfigError.
    static Scenario build(u32 party_level, const std::vector<std::string>& classes,
                          const std::vector<std::string>& monsters, const std::vector<i64>& counts,
                          const std::vector<i32>& test_stats = {});

    static std::vector<std::string_view> split_list(std::string_view sv, char delim = ',');
    static std::string_view trim(std::string_view sv);
    static std::optional<i64> parse_integer(std::string_view sv);

    // Reads an integer that is at least min_value and fits in T into out.
    // Returns the problem instead when there is one; out is then untouched.
    template<typename T>
    static std::optional<std::string> parse_bounded(std::string_view sv, T& out, i64 min_value) {
        auto value = parse_integer(sv);
        if (!value) return "expects a number, got '" + std::string(trim(sv)) + "'";
        if (*value < min_value) return "must be at least " + std::to_string(min_value);
        if (!std::in_range<T>(*value)) return "must be at most " + std::to_string(std::numeric_limits<T>::max());
        out = static_cast<T>(*value);
        return std::nullopt;
    }

private:
    static void check_test_stats(const std::vector<std::string>& monsters, size_t stat_count,
                                 std::vector<std::string>& errors);
    static TestStats to_test_stats(const std::vector<i32>& values);
};

} // namespace d20
