#pragma once

#include "core/types.hpp"
#include "catalog/scenario.hpp"
#include "engine/adventuring_day.hpp"
#include "engine/dice.hpp"
#include "engine/trace.hpp"
#include "simulation/statistics.hpp"
#include <functional>

namespace d20 {

// ==============================================================================
// Simulation Configuration
// ==============================================================================

struct SimulationConfig {
    u32 days = 1000;              // Adventuring days to aggregate
    u64 seed = 0;                 // 0 = derive from the clock
    u32 batch_size = 50;          // Days per thread-pool task
    u32 threads = 0;              // 0 = hardware concurrency
    u32 max_rounds = DEFAULT_MAX_ROUNDS;
    bool enable_progress = true;

    // Throws ConfigError when the run cannot start
    void validate() const;
};

// ==============================================================================
// Progress Callback
// ==============================================================================

using ProgressCallback = std::function<void(u64 completed, u64 total, f64 rate)>;

// ==============================================================================
// Day Batch Runner (used by thread pool workers)
// Day i of a run is seeded from the base seed and i alone.
// ==============================================================================

class DayBatchRunner {
public:
    DayBatchRunner(const Scenario& scenario, const SimulationConfig& config, u64 base_seed)
        : scenario_(scenario), config_(config), base_seed_(base_seed) {}

    DayResult run_day(u64 day_index);

    void run_batch(u64 first_day, u32 count, LocalStats& stats);

private:
    const Scenario& scenario_;
    const SimulationConfig& config_;
    u64 base_seed_;
    DiceRoller dice_;
};

// ==============================================================================
// Monte Carlo Aggregator
// ==============================================================================

class Simulator {
public:
    explicit Simulator(const SimulationConfig& config = SimulationConfig());

    // Mean and deviation of survivors over config.days independent days
    SurvivalStatistics run(const Scenario& scenario, ProgressCallback progress = nullptr);

    // One day with every action recorded in `trace`
    DayResult run_debug_day(const Scenario& scenario, TraceLog& trace);

    // The seed in use; resolved from the clock when the config asks for 0
    u64 seed() const { return seed_; }

    SimulationConfig& config() { return config_; }
    const SimulationConfig& config() const { return config_; }

private:
    SimulationConfig config_;
    u64 seed_;
};

} // namespace d20
