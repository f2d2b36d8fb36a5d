#include "catalog/scenario.hpp"
#include "engine/adventuring_day.hpp"
#include "simulation/simulator.hpp"
#include "simulation/thread_pool.hpp"
#include "utils/timer.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>

using namespace d20;

int main() {
    std::cout << "=== Adventuring Day Benchmarks ===" << std::endl;
    std::cout << std::endl;

    initialize_catalog();

    struct Case {
        u32 level;
        const char* monster;
        i64 count;
    };

    // Single-threaded days per second across party levels and crowd sizes
    for (const Case& c : {Case{1, "Kobold", 4}, Case{1, "Kobold", 8}, Case{4, "Orc", 4},
                          Case{8, "Ogre", 3}, Case{8, "Giant rat", 30}}) {
        Scenario scenario = ScenarioParser::build(c.level, default_party_classes(), {c.monster}, {c.count});

        const u64 days = 5000;
        SimulationConfig config;
        config.max_rounds = DEFAULT_MAX_ROUNDS;
        DayBatchRunner runner(scenario, config, 12345);
        LocalStats stats;

        Timer timer;
        runner.run_batch(0, static_cast<u32>(days), stats);
        const double ms = std::max(1.0, timer.elapsed_ms());

        const double days_per_sec = days * 1000.0 / ms;

        std::cout << "Level " << c.level << " vs " << scenario.label() << ":" << std::endl;
        std::cout << "  Days: " << days << std::endl;
        std::cout << "  Time: " << std::fixed << std::setprecision(0) << ms << " ms" << std::endl;
        std::cout << "  Rate: " << days_per_sec << " days/sec" << std::endl;
        std::cout << "  Mean survivors: " << std::setprecision(3)
                  << static_cast<double>(stats.survivors) / stats.days << std::endl;
        std::cout << "  Avg rounds per day: " << std::setprecision(1)
                  << static_cast<double>(stats.rounds) / stats.days << std::endl;
        std::cout << std::endl;
    }

    // Full Monte Carlo run on every core
    {
        Scenario scenario = ScenarioParser::build(3, default_party_classes(), {"Wolf", "Goblin"}, {3, 3});

        SimulationConfig config;
        config.days = 100'000;
        config.seed = 42;
        config.enable_progress = false;
        Simulator simulator(config);

        Timer timer;
        SurvivalStatistics result = simulator.run(scenario);
        const double seconds = std::max(1e-3, timer.elapsed_sec());

        const size_t threads = ThreadPool::default_thread_count();
        std::cout << "=== Threaded Run (" << threads << " threads) ===" << std::endl;
        std::cout << "  Scenario: Level 3 " << scenario.label() << std::endl;
        std::cout << "  Days: " << result.days << std::endl;
        std::cout << "  Time: " << std::setprecision(2) << seconds << " s" << std::endl;
        std::cout << "  Rate: " << std::setprecision(0) << result.days / seconds << " days/sec" << std::endl;
        std::cout << "  Survival: " << std::setprecision(4) << result.mean << " +/- " << result.stddev << std::endl;
        std::cout << std::endl;
    }

    return 0;
}
