#pragma once

#include "core/types.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace d20 {

// ==============================================================================
// Trace Events - Action-level record of one simulated day
// ==============================================================================

enum class TraceKind : u8 {
    Note = 0,       // Free text (initiative order, rests, outcomes)
    Attack,         // Attack roll against armor class
    Save,           // Saving throw against a difficulty class
    Damage,         // Hit point loss
    Healing,        // Hit point gain
    Condition       // Condition applied or ended
};

struct TraceEvent {
    TraceKind kind = TraceKind::Note;
    u8  encounter = 0;          // 1-based, 0 outside encounters
    u32 round = 0;
    std::string actor;
    std::string action;
    std::string target;
    i32 natural_roll = 0;
    i32 total_roll = 0;
    i32 target_number = 0;     // Armor class or save DC
    i32 hp_before = 0;
    i32 hp_after = 0;
    std::string detail;
};

inline std::string format_event(const TraceEvent& e) {
    std::ostringstream out;
    if (e.encounter > 0) {
        out << "[E" << static_cast<int>(e.encounter) << " R" << e.round << "] ";
    }

    switch (e.kind) {
        case TraceKind::Note:
            out << e.detail;
            return out.str();
        case TraceKind::Attack:
            out << e.actor << " " << e.action << " -> " << e.target
                << ": d20=" << e.natural_roll << " total " << e.total_roll
                << " vs AC " << e.target_number;
            break;
        case TraceKind::Save:
            out << e.target << " " << e.action << " save: d20=" << e.natural_roll
                << " total " << e.total_roll << " vs DC " << e.target_number;
            break;
        case TraceKind::Damage:
            out << e.target << " takes " << (e.hp_before - e.hp_after) << " from " << e.actor
                << " (" << e.action << "), HP " << e.hp_before << " -> " << e.hp_after;
            break;
        case TraceKind::Healing:
            out << e.target << " healed " << (e.hp_after - e.hp_before) << " by " << e.actor
                << " (" << e.action << "), HP " << e.hp_before << " -> " << e.hp_after;
            break;
        case TraceKind::Condition:
            out << e.target << " " << e.action;
            if (!e.actor.empty()) out << " (" << e.actor << ")";
            break;
    }

    if (!e.detail.empty()) out << " [" << e.detail << "]";
    return out.str();
}

// ==============================================================================
// Trace Log - Sink the engine writes to through a nullable pointer
// ==============================================================================

class TraceLog {
public:
    void record(TraceEvent event) { events_.push_back(std::move(event)); }

    const std::vector<TraceEvent>& events() const { return events_; }
    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }
    void clear() { events_.clear(); }

    std::string render() const {
        std::string text;
        for (const auto& e : events_) {
            text += format_event(e);
            text += '\n';
        }
        return text;
    }

private:
    std::vector<TraceEvent> events_;
};

} // namespace d20
