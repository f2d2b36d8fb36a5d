#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include <cassert>
#include <numeric>
#include <vector>

namespace d20 {

// ==============================================================================
// Day Layout
// ==============================================================================

struct DayConfig {
    u8 encounters_per_long_rest  = 6;
    u8 encounters_per_short_rest = 2;   // Short rests after encounters 2 and 4

    u8 interval_length(RestKind interval) const {
        return interval == RestKind::Long ? encounters_per_long_rest : encounters_per_short_rest;
    }
};

// ==============================================================================
// Ration Schedule
// Spreads `total` uses over `encounters` encounters. The even share goes to
// every encounter; the remainder goes to the first encounters (front-loaded)
// or to the last ones (back-loaded).
//
//   total 10 over 6, front-loaded: [2, 2, 2, 2, 1, 1]
//   total 10 over 6, back-loaded:  [1, 1, 2, 2, 2, 2]
// ==============================================================================

class RationSchedule {
public:
    RationSchedule() = default;

    static RationSchedule build(u32 total, u32 encounters, RationPolicy policy) {
        RationSchedule schedule;
        schedule.total_ = total;
        if (encounters == 0) return schedule;

        const u32 share = total / encounters;
        const u32 extra = total % encounters;
        schedule.allotments_.reserve(encounters);
        for (u32 i = 0; i < encounters; ++i) {
            bool gets_extra = (policy == RationPolicy::FrontLoaded)
                ? i < extra
                : encounters - i <= extra;
            schedule.allotments_.push_back(share + (gets_extra ? 1 : 0));
        }

        assert(std::accumulate(schedule.allotments_.begin(), schedule.allotments_.end(), 0u) == total);
        return schedule;
    }

    const std::vector<u32>& allotments() const { return allotments_; }
    u32 encounters() const { return static_cast<u32>(allotments_.size()); }
    u32 total() const { return total_; }

    u32 allotment(u32 encounter) const {
        return encounter < allotments_.size() ? allotments_[encounter] : 0;
    }

    // Uses the plan expects to still hold once `encounter` is over
    u32 remaining_after(u32 encounter) const {
        u32 spent = 0;
        for (u32 i = 0; i <= encounter && i < allotments_.size(); ++i) {
            spent += allotments_[i];
        }
        return total_ - spent;
    }

private:
    u32 total_ = 0;
    std::vector<u32> allotments_;
};

// ==============================================================================
// Applying schedules at encounter start
// ==============================================================================

inline void apply_ration(Ration& ration, const DayConfig& day,
                         u8 encounters_since_short_rest, u8 encounters_since_long_rest) {
    if (!ration.enabled) return;
    const u8 length = day.interval_length(ration.interval);
    const u8 position = ration.interval == RestKind::Long
        ? encounters_since_long_rest
        : encounters_since_short_rest;
    RationSchedule schedule = RationSchedule::build(ration.budget, length, ration.policy);
    ration.reserve = static_cast<i16>(schedule.remaining_after(position));
}

inline void apply_rations(Combatant& c, const DayConfig& day,
                          u8 encounters_since_short_rest, u8 encounters_since_long_rest) {
    for (auto& r : c.resource_rations) {
        apply_ration(r, day, encounters_since_short_rest, encounters_since_long_rest);
    }
    apply_ration(c.slot_ration, day, encounters_since_short_rest, encounters_since_long_rest);
}

} // namespace d20
