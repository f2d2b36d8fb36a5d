/**
 * d20 Adventuring Day Simulator
 *
 * Monte Carlo estimate of how many members of a d20 party are still standing
 * after an adventuring day of six encounters against the same monsters, with
 * short rests after the second and fourth encounter.
 */

#include "core/types.hpp"
#include "catalog/bestiary.hpp"
#include "catalog/registry.hpp"
#include "catalog/scenario.hpp"
#include "engine/trace.hpp"
#include "simulation/simulator.hpp"
#include "simulation/thread_pool.hpp"
#include "utils/timer.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace d20;

// ==============================================================================
// CLI Configuration
// ==============================================================================

struct CliConfig {
    ScenarioParser::Input scenario;
    SimulationConfig sim;
    bool debug = false;
    bool verbose = false;
    bool quiet = false;
    bool list = false;
    bool show_help = false;
    std::vector<std::string> errors;
};

// ==============================================================================
// Progress Display
// ==============================================================================

class ProgressDisplay {
public:
    void update(u64 completed, u64 total, f64 rate) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_).count();

        if (elapsed - last_update_ < 100 && completed < total) return;
        last_update_ = elapsed;

        f64 pct = total == 0 ? 100.0 : 100.0 * completed / total;
        f64 eta_sec = rate > 0.0 ? (total - completed) / rate : 0.0;

        std::cerr << "\r[";
        int bar_width = 40;
        int filled = static_cast<int>(bar_width * pct / 100.0);
        for (int i = 0; i < bar_width; ++i) {
            std::cerr << (i < filled ? '=' : (i == filled ? '>' : ' '));
        }

        std::cerr << "] " << std::fixed << std::setprecision(1) << pct << "% ";
        std::cerr << "(" << completed << "/" << total << ") ";
        std::cerr << static_cast<u64>(rate) << " days/s ";
        std::cerr << "ETA: " << static_cast<int>(eta_sec) << "s   " << std::flush;
    }

    void finish() {
        std::cerr << "\r" << std::string(80, ' ') << "\r" << std::flush;
    }

private:
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
    i64 last_update_ = -1000;
};

// ==============================================================================
// Main Entry Point
// ==============================================================================

void print_banner() {
    std::cout << R"(
      _ ___   ___   ___ _
   __| |_  ) /   \ / __(_)_ __
  / _` |/ / | () | \__ \ | '  \
  \__,_/___| \___/  |___/_|_|_|_|

 d20 Adventuring Day Survival Simulator
)" << std::endl;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -a <days>      Adventuring days to simulate (default: 1000)\n";
    std::cout << "  -c <list>      Party classes (default: Cleric,Fighter,Rogue,Wizard)\n";
    std::cout << "  -m <list>      Monster names (default: Kobold)\n";
    std::cout << "  -n <list>      Monster counts, one per name (default: 4)\n";
    std::cout << "  -p <level>     Party level, 1 to 8 (default: 1)\n";
    std::cout << "  -t <list>      Test creature: attack,AC,damage,HP,attacks,proficiency\n";
    std::cout << "  -s <seed>      Base seed (default: clock)\n";
    std::cout << "  -j <threads>   Worker threads (default: all cores)\n";
    std::cout << "  -d             Simulate one day and print every action\n";
    std::cout << "  -v             Verbose output (histogram and timing)\n";
    std::cout << "  -q             Quiet: result line only\n";
    std::cout << "  -l             List party classes and monsters\n";
    std::cout << "  -h             Show this help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog << " -m Kobold -n 8\n";
    std::cout << "  " << prog << " -p 5 -m Orc,Wolf -n 3,2 -a 10000\n";
    std::cout << "  " << prog << " -p 3 -m Test -n 2 -t 5,13,10,30,2,2\n";
    std::cout << "  " << prog << " -d -s 42\n";
}

// Reads an integer flag value; problems go to config.errors
template<typename T>
void read_number(CliConfig& config, const std::string& flag, const char* text, T& out, i64 min_value) {
    if (auto problem = ScenarioParser::parse_bounded(text, out, min_value)) {
        config.errors.push_back(flag + " " + *problem);
    }
}

CliConfig parse_args(int argc, char* argv[]) {
    CliConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "-d" || arg == "--debug") {
            config.debug = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-l" || arg == "--list") {
            config.list = true;
        } else if (arg == "-a" && has_value) {
            read_number(config, arg, argv[++i], config.sim.days, 1);
        } else if (arg == "-c" && has_value) {
            config.scenario.classes = argv[++i];
        } else if (arg == "-m" && has_value) {
            config.scenario.monsters = argv[++i];
        } else if (arg == "-n" && has_value) {
            config.scenario.counts = argv[++i];
        } else if (arg == "-p" && has_value) {
            config.scenario.level = argv[++i];
        } else if (arg == "-t" && has_value) {
            config.scenario.test_stats = argv[++i];
        } else if (arg == "-s" && has_value) {
            read_number(config, arg, argv[++i], config.sim.seed, 0);
        } else if (arg == "-j" && has_value) {
            read_number(config, arg, argv[++i], config.sim.threads, 1);
        } else {
            config.errors.push_back("unknown or incomplete option '" + arg + "'");
        }
    }

    config.sim.enable_progress = !config.quiet;
    return config;
}

void print_catalog() {
    const auto& registry = get_combatant_registry();

    std::cout << "Party classes:" << std::endl;
    for (const auto& name : registry.names(Team::Party)) std::cout << "  " << name << std::endl;

    std::cout << "Monsters:" << std::endl;
    for (const auto& name : registry.names(Team::Monsters)) std::cout << "  " << name << std::endl;
}

void print_result(const Scenario& scenario, const SurvivalStatistics& stats) {
    std::cout << "Level " << std::setw(2) << static_cast<int>(scenario.party_level) << " "
              << scenario.label() << " Survival "
              << std::fixed << std::setprecision(4) << std::setw(6) << stats.mean << " +/- "
              << std::setw(6) << stats.stddev << std::endl;
}

void print_details(const Scenario& scenario, const SurvivalStatistics& stats, u64 seed, f64 seconds) {
    std::cout << std::endl;
    std::cout << "Survivors after " << stats.days << " days:" << std::endl;
    for (size_t s = 0; s <= scenario.party_classes.size(); ++s) {
        std::cout << "  " << s << ": " << std::fixed << std::setprecision(1)
                  << std::setw(5) << (100.0 * stats.survivor_rate(s)) << "%" << std::endl;
    }
    std::cout << std::setprecision(2);
    std::cout << "  Avg encounters fought: " << stats.avg_encounters_completed << std::endl;
    std::cout << "  Avg rounds per day: " << stats.avg_rounds << std::endl;
    std::cout << "  Simultaneous defeats: " << stats.simultaneous_defeats << std::endl;
    std::cout << "  Seed: " << seed << std::endl;
    std::cout << "  Time: " << std::setprecision(3) << seconds << "s ("
              << std::setprecision(0) << (seconds > 0.0 ? stats.days / seconds : 0.0)
              << " days/second)" << std::endl;
}

int main(int argc, char* argv[]) {
    CliConfig config = parse_args(argc, argv);

    if (config.show_help) {
        print_banner();
        print_usage(argv[0]);
        return 0;
    }

    initialize_catalog();

    if (config.list) {
        print_catalog();
        return 0;
    }

    auto parsed = ScenarioParser::parse(config.scenario);
    config.errors.insert(config.errors.end(), parsed.errors.begin(), parsed.errors.end());

    if (!config.errors.empty() || !parsed.scenario) {
        for (const auto& err : config.errors) {
            std::cerr << "Error: " << err << std::endl;
        }
        std::cerr << "Run with -h for usage." << std::endl;
        return 1;
    }

    const Scenario& scenario = *parsed.scenario;

    try {
        Simulator simulator(config.sim);

        if (config.debug) {
            TraceLog trace;
            simulator.run_debug_day(scenario, trace);
            std::cout << trace.render();
            if (config.verbose) std::cout << "Seed: " << simulator.seed() << std::endl;
            return 0;
        }

        if (!config.quiet) {
            print_banner();
            std::cout << "Party: level " << static_cast<int>(scenario.party_level);
            for (const auto& name : scenario.party_classes) std::cout << " " << name;
            std::cout << std::endl;
            std::cout << "Threads: " << (config.sim.threads != 0 ? config.sim.threads
                                                                  : ThreadPool::default_thread_count())
                      << std::endl << std::endl;
        }

        ProgressDisplay progress;
        ProgressCallback callback = nullptr;
        if (config.sim.enable_progress) {
            callback = [&progress](u64 done, u64 total, f64 rate) { progress.update(done, total, rate); };
        }

        Timer timer;
        SurvivalStatistics stats = simulator.run(scenario, callback);
        const f64 seconds = timer.elapsed_sec();
        if (config.sim.enable_progress) progress.finish();

        print_result(scenario, stats);
        if (config.verbose) print_details(scenario, stats, simulator.seed(), seconds);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
