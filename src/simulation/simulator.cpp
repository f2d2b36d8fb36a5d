#include "simulation/simulator.hpp"
#include "simulation/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <vector>

namespace d20 {

void SimulationConfig::validate() const {
    std::vector<std::string> errors;
    if (days == 0) errors.push_back("the number of adventuring days must be positive");
    if (batch_size == 0) errors.push_back("batch size must be positive");
    if (max_rounds == 0) errors.push_back("round limit must be positive");
    if (!errors.empty()) throw ConfigError(errors);
}

// ==============================================================================
// Day Batch Runner
// ==============================================================================

DayResult DayBatchRunner::run_day(u64 day_index) {
    dice_.seed(derive_seed(base_seed_, day_index));
    return simulate_day(scenario_, dice_, nullptr, config_.max_rounds);
}

void DayBatchRunner::run_batch(u64 first_day, u32 count, LocalStats& stats) {
    for (u32 i = 0; i < count; ++i) {
        stats.add(run_day(first_day + i));
    }
}

// ==============================================================================
// Simulator
// ==============================================================================

Simulator::Simulator(const SimulationConfig& config) : config_(config), seed_(config.seed) {
    if (seed_ == 0) {
        seed_ = static_cast<u64>(std::chrono::steady_clock::now().time_since_epoch().count());
    }
}

SurvivalStatistics Simulator::run(const Scenario& scenario, ProgressCallback progress) {
    config_.validate();
    initialize_catalog();
    if (auto problems = scenario.validate(); !problems.empty()) throw ConfigError(problems);

    AtomicStats atomic_stats;
    atomic_stats.reset();

    const u64 total_days = config_.days;
    const u32 batch_size = config_.batch_size;
    const u64 num_batches = (total_days + batch_size - 1) / batch_size;

    // A dedicated pool when a thread count is requested, the shared one otherwise
    std::unique_ptr<ThreadPool> own_pool;
    if (config_.threads != 0) own_pool = std::make_unique<ThreadPool>(config_.threads);
    ThreadPool& pool = own_pool ? *own_pool : get_thread_pool();

    std::vector<std::future<LocalStats>> futures;
    futures.reserve(num_batches);

    const auto start_time = std::chrono::steady_clock::now();

    for (u64 b = 0; b < num_batches; ++b) {
        const u64 first_day = b * batch_size;
        const u32 batch_days = static_cast<u32>(std::min<u64>(batch_size, total_days - first_day));

        futures.push_back(pool.submit([&scenario, first_day, batch_days, this]() {
            LocalStats local;
            DayBatchRunner runner(scenario, config_, seed_);
            runner.run_batch(first_day, batch_days, local);
            return local;
        }));
    }

    // Merging in submission order keeps the sums independent of scheduling
    u64 done = 0;
    for (auto& future : futures) {
        LocalStats local = future.get();
        local.merge_into(atomic_stats);
        done += local.days;

        if (progress) {
            const f64 elapsed = std::chrono::duration<f64>(std::chrono::steady_clock::now() - start_time).count();
            progress(done, total_days, elapsed > 0.0 ? done / elapsed : 0.0);
        }
    }

    return SurvivalStatistics::compute(atomic_stats);
}

DayResult Simulator::run_debug_day(const Scenario& scenario, TraceLog& trace) {
    config_.validate();
    initialize_catalog();
    if (auto problems = scenario.validate(); !problems.empty()) throw ConfigError(problems);

    DiceRoller dice(derive_seed(seed_, 0));
    AdventuringDay day(scenario, dice, &trace, config_.max_rounds);
    const DayResult result = day.run();

    TraceEvent summary;
    summary.detail = "Survivors: " + std::to_string(result.survivors);
    if (result.simultaneous_defeat) summary.detail += " (simultaneous defeat)";
    trace.record(std::move(summary));
    return result;
}

} // namespace d20
