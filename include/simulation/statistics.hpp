#pragma once

#include "core/types.hpp"
#include "engine/adventuring_day.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <vector>

namespace d20 {

constexpr size_t SURVIVOR_BUCKETS = MAX_PARTY_SIZE + 1;

// ==============================================================================
// Atomic Statistics Accumulator
// Shared by all batches of one run
// ==============================================================================

struct AtomicStats {
    std::atomic<u64> days{0};
    std::atomic<u64> survivors{0};
    std::atomic<u64> survivors_squared{0};
    std::atomic<u64> simultaneous_defeats{0};
    std::atomic<u64> encounters_completed{0};
    std::atomic<u64> rounds{0};

    std::array<std::atomic<u64>, SURVIVOR_BUCKETS> histogram{};

    void reset() {
        days = 0;
        survivors = 0;
        survivors_squared = 0;
        simultaneous_defeats = 0;
        encounters_completed = 0;
        rounds = 0;
        for (auto& h : histogram) h = 0;
    }
};

// ==============================================================================
// Per-Batch Statistics (No atomics needed)
// ==============================================================================

struct LocalStats {
    u64 days = 0;
    u64 survivors = 0;
    u64 survivors_squared = 0;
    u64 simultaneous_defeats = 0;
    u64 encounters_completed = 0;
    u64 rounds = 0;

    std::array<u64, SURVIVOR_BUCKETS> histogram{};

    void add(const DayResult& day) {
        ++days;
        survivors += day.survivors;
        survivors_squared += static_cast<u64>(day.survivors) * day.survivors;
        if (day.simultaneous_defeat) ++simultaneous_defeats;
        encounters_completed += day.encounters_completed;
        rounds += day.rounds;
        ++histogram[std::min<size_t>(day.survivors, SURVIVOR_BUCKETS - 1)];
    }

    void merge_into(AtomicStats& target) const {
        target.days += days;
        target.survivors += survivors;
        target.survivors_squared += survivors_squared;
        target.simultaneous_defeats += simultaneous_defeats;
        target.encounters_completed += encounters_completed;
        target.rounds += rounds;
        for (size_t i = 0; i < histogram.size(); ++i) {
            target.histogram[i] += histogram[i];
        }
    }
};

// ==============================================================================
// Survival Statistics (Computed from AtomicStats)
// ==============================================================================

struct SurvivalStatistics {
    u64 days = 0;
    f64 mean = 0.0;
    f64 stddev = 0.0;          // Sample deviation, n - 1 in the denominator
    u64 simultaneous_defeats = 0;
    f64 avg_encounters_completed = 0.0;
    f64 avg_rounds = 0.0;

    std::array<u64, SURVIVOR_BUCKETS> histogram{};

    f64 survivor_rate(size_t survivors) const {
        if (days == 0 || survivors >= histogram.size()) return 0.0;
        return static_cast<f64>(histogram[survivors]) / static_cast<f64>(days);
    }

    static SurvivalStatistics compute(const AtomicStats& stats) {
        SurvivalStatistics result;
        result.days = stats.days.load();
        result.simultaneous_defeats = stats.simultaneous_defeats.load();
        for (size_t i = 0; i < result.histogram.size(); ++i) {
            result.histogram[i] = stats.histogram[i].load();
        }

        const u64 n = result.days;
        if (n == 0) return result;

        const f64 inv_n = 1.0 / static_cast<f64>(n);
        const f64 sum = static_cast<f64>(stats.survivors.load());
        const f64 sum_sq = static_cast<f64>(stats.survivors_squared.load());

        result.mean = sum * inv_n;
        if (n > 1) {
            const f64 variance = (sum_sq - sum * result.mean) / static_cast<f64>(n - 1);
            result.stddev = std::sqrt(std::max(0.0, variance));
        }
        result.avg_encounters_completed = static_cast<f64>(stats.encounters_completed.load()) * inv_n;
        result.avg_rounds = static_cast<f64>(stats.rounds.load()) * inv_n;
        return result;
    }

    static SurvivalStatistics from_results(const std::vector<DayResult>& results) {
        LocalStats local;
        for (const auto& r : results) local.add(r);
        AtomicStats stats;
        local.merge_into(stats);
        return compute(stats);
    }
};

} // namespace d20
