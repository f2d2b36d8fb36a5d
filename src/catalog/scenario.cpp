#include "catalog/scenario.hpp"
#include "catalog/bestiary.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace d20 {

constexpr size_t TEST_STAT_COUNT = 6;

// ==============================================================================
// Scenario
// ==============================================================================

std::string Scenario::label() const {
    std::string text;
    for (const auto& g : monsters) {
        if (!text.empty()) text += ' ';
        text += g.name == "Test" ? test_creature_label(test_stats) : g.name;
        text += ' ' + std::to_string(g.count);
    }
    return text;
}

std::vector<std::string> Scenario::validate() const {
    std::vector<std::string> errors;
    const auto& registry = get_combatant_registry();

    if (party_level < MIN_PARTY_LEVEL || party_level > MAX_PARTY_LEVEL) {
        errors.push_back("party level " + std::to_string(party_level) + " is outside "
                         + std::to_string(MIN_PARTY_LEVEL) + ".." + std::to_string(MAX_PARTY_LEVEL));
    }

    if (party_classes.empty()) errors.push_back("the party has no members");
    if (party_classes.size() > MAX_PARTY_SIZE) {
        errors.push_back("a party holds at most " + std::to_string(MAX_PARTY_SIZE) + " characters");
    }
    for (const auto& name : party_classes) {
        if (registry.find(name, Team::Party) == nullptr) errors.push_back("unknown class '" + name + "'");
    }

    if (monsters.empty()) errors.push_back("no monsters given");
    for (const auto& g : monsters) {
        if (registry.find(g.name, Team::Monsters) == nullptr) errors.push_back("unknown monster '" + g.name + "'");
        if (g.count == 0) errors.push_back("monster count for '" + g.name + "' must be positive");
    }
    const bool has_test = std::any_of(monsters.begin(), monsters.end(),
                                      [](const MonsterGroup& g) { return g.name == "Test"; });
    if (has_test) {
        for (auto& problem : test_stats_problems(test_stats)) errors.push_back(std::move(problem));
    }
    if (monster_total() > MAX_MONSTER_COUNT) {
        errors.push_back("an encounter holds at most " + std::to_string(MAX_MONSTER_COUNT) + " monsters");
    }

    return errors;
}

// ==============================================================================
// Parsing helpers
// ==============================================================================

std::string_view ScenarioParser::trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
}

std::vector<std::string_view> ScenarioParser::split_list(std::string_view sv, char delim) {
    std::vector<std::string_view> result;
    if (trim(sv).empty()) return result;

    size_t start = 0;
    while (true) {
        const size_t end = sv.find(delim, start);
        result.push_back(trim(sv.substr(start, end == std::string_view::npos ? sv.npos : end - start)));
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return result;
}

std::optional<i64> ScenarioParser::parse_integer(std::string_view sv) {
    sv = trim(sv);
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    if (sv.empty()) return std::nullopt;

    i64 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc() || ptr != sv.data() + sv.size()) return std::nullopt;
    return value;
}

void ScenarioParser::check_test_stats(const std::vector<std::string>& monsters, size_t stat_count,
                                      std::vector<std::string>& errors) {
    const bool wants_test = std::find(monsters.begin(), monsters.end(), "Test") != monsters.end();
    if (wants_test && stat_count != TEST_STAT_COUNT) {
        errors.push_back("the Test creature needs exactly " + std::to_string(TEST_STAT_COUNT)
                         + " stats (attack, AC, damage, HP, attacks, proficiency), got "
                         + std::to_string(stat_count));
    }
}

TestStats ScenarioParser::to_test_stats(const std::vector<i32>& values) {
    TestStats stats;
    if (values.size() != TEST_STAT_COUNT) return stats;
    stats.attack = values[0];
    stats.armor_class = values[1];
    stats.damage = values[2];
    stats.hit_points = values[3];
    stats.attacks = values[4];
    stats.proficiency = values[5];
    return stats;
}

// ==============================================================================
// Entry points
// ==============================================================================

ScenarioParser::ParseResult ScenarioParser::parse(const Input& input) {
    ParseResult result;

    std::vector<std::string> classes;
    for (auto name : split_list(input.classes)) classes.emplace_back(name);

    std::vector<std::string> monsters;
    for (auto name : split_list(input.monsters)) monsters.emplace_back(name);

    std::vector<i64> counts;
    for (auto field : split_list(input.counts)) {
        if (auto value = parse_integer(field)) {
            counts.push_back(*value);
        } else {
            result.errors.push_back("monster count '" + std::string(field) + "' is not a number");
        }
    }

    u32 level = 0;
    if (auto value = parse_integer(input.level); value && *value >= 0 && *value <= 255) {
        level = static_cast<u32>(*value);
    } else {
        result.errors.push_back("party level '" + input.level + "' is not a number");
    }

    std::vector<i32> stats;
    for (auto field : split_list(input.test_stats)) {
        if (auto value = parse_integer(field); value && *value >= -1000 && *value <= 100000) {
            stats.push_back(static_cast<i32>(*value));
        } else {
            result.errors.push_back("test stat '" + std::string(field) + "' is not a number");
        }
    }

    if (!result.errors.empty()) return result;

    try {
        result.scenario = build(level, classes, monsters, counts, stats);
    } catch (const ConfigError& e) {
        result.errors.push_back(e.what());
    }
    return result;
}

Scenario ScenarioParser::build(u32 party_level, const std::vector<std::string>& classes,
                               const std::vector<std::string>& monsters, const std::vector<i64>& counts,
                               const std::vector<i32>& test_stats) {
    initialize_catalog();
    std::vector<std::string> errors;

    if (monsters.size() != counts.size()) {
        errors.push_back(std::to_string(monsters.size()) + " monster names but "
                         + std::to_string(counts.size()) + " counts");
    }
    for (i64 count : counts) {
        if (count <= 0) errors.push_back("monster count " + std::to_string(count) + " must be positive");
    }
    if (party_level < MIN_PARTY_LEVEL || party_level > MAX_PARTY_LEVEL) {
        errors.push_back("party level " + std::to_string(party_level) + " is outside "
                         + std::to_string(MIN_PARTY_LEVEL) + ".." + std::to_string(MAX_PARTY_LEVEL));
    }
    check_test_stats(monsters, test_stats.size(), errors);
    if (!errors.empty()) throw ConfigError(errors);

    Scenario scenario;
    scenario.party_level = static_cast<u8>(party_level);
    scenario.party_classes = classes;
    for (size_t i = 0; i < monsters.size(); ++i) {
        scenario.monsters.push_back(MonsterGroup{monsters[i], static_cast<u32>(std::min<i64>(counts[i], 1000000))});
    }
    scenario.test_stats = to_test_stats(test_stats);

    errors = scenario.validate();
    if (!errors.empty()) throw ConfigError(errors);
    return scenario;
}

} // namespace d20
