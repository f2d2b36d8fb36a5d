#include "engine/ration.hpp"
#include "core/combatant.hpp"
#include <iostream>
#include <algorithm>
#include <cassert>
#include <numeric>
#include <vector>

using namespace d20;

void test_front_loaded_schedule() {
    auto schedule = RationSchedule::build(10, 6, RationPolicy::FrontLoaded);
    assert((schedule.allotments() == std::vector<u32>{2, 2, 2, 2, 1, 1}));
    std::cout << "[PASS] test_front_loaded_schedule" << std::endl;
}

void test_back_loaded_schedule() {
    auto schedule = RationSchedule::build(10, 6, RationPolicy::BackLoaded);
    assert((schedule.allotments() == std::vector<u32>{1, 1, 2, 2, 2, 2}));

    auto channel = RationSchedule::build(1, 2, RationPolicy::BackLoaded);
    assert((channel.allotments() == std::vector<u32>{0, 1}));
    std::cout << "[PASS] test_back_loaded_schedule" << std::endl;
}

void test_allotments_sum_to_total() {
    for (u32 total = 0; total <= 20; ++total) {
        for (u32 n = 1; n <= 6; ++n) {
            for (auto policy : {RationPolicy::FrontLoaded, RationPolicy::BackLoaded}) {
                auto s = RationSchedule::build(total, n, policy);
                assert(s.encounters() == n);
                const auto& a = s.allotments();
                assert(std::accumulate(a.begin(), a.end(), 0u) == total);

                // Allotments never differ by more than one
                auto [lo, hi] = std::minmax_element(a.begin(), a.end());
                assert(*hi - *lo <= 1);
            }
        }
    }
    std::cout << "[PASS] test_allotments_sum_to_total" << std::endl;
}

void test_remaining_after() {
    auto schedule = RationSchedule::build(10, 6, RationPolicy::FrontLoaded);
    assert(schedule.remaining_after(0) == 8);
    assert(schedule.remaining_after(3) == 2);
    assert(schedule.remaining_after(5) == 0);
    assert(schedule.remaining_after(9) == 0);
    assert(schedule.allotment(9) == 0);
    std::cout << "[PASS] test_remaining_after" << std::endl;
}

void test_zero_encounters() {
    auto schedule = RationSchedule::build(5, 0, RationPolicy::FrontLoaded);
    assert(schedule.encounters() == 0);
    assert(schedule.allotment(0) == 0);
    std::cout << "[PASS] test_zero_encounters" << std::endl;
}

void test_slot_ration_reserve() {
    Combatant wizard("Wizard", Team::Party);
    wizard.set_spell_slots({4, 2});
    wizard.slot_ration.enabled = true;
    wizard.slot_ration.policy = RationPolicy::FrontLoaded;
    wizard.slot_ration.interval = RestKind::Long;
    wizard.slot_ration.budget = 5;

    DayConfig day;

    // [1, 1, 1, 1, 1, 0] over the day: one slot per encounter for the first five
    apply_rations(wizard, day, 0, 0);
    assert(wizard.slot_ration.reserve == 4);
    assert(wizard.within_slot_ration());

    wizard.spend_slot(1);
    wizard.spend_slot(1);
    assert(wizard.spell_slots_remaining() == 4);
    assert(!wizard.within_slot_ration());

    apply_rations(wizard, day, 1, 1);
    assert(wizard.slot_ration.reserve == 3);
    assert(wizard.within_slot_ration());
    std::cout << "[PASS] test_slot_ration_reserve" << std::endl;
}

void test_short_rest_resource_ration() {
    Combatant cleric("Cleric", Team::Party);
    ResourcePool& channel = cleric.resource(ResourceId::ChannelDivinity);
    channel.maximum = 1;
    channel.remaining = 1;

    Ration& r = cleric.ration(ResourceId::ChannelDivinity);
    r.enabled = true;
    r.policy = RationPolicy::BackLoaded;
    r.interval = RestKind::Short;
    r.budget = 1;

    DayConfig day;

    // Held for the second encounter of each short-rest interval
    apply_rations(cleric, day, 0, 2);
    assert(!cleric.within_ration(ResourceId::ChannelDivinity));

    apply_rations(cleric, day, 1, 3);
    assert(cleric.within_ration(ResourceId::ChannelDivinity));

    // Unrationed resources only need a use left
    r.enabled = false;
    channel.remaining = 0;
    assert(!cleric.within_ration(ResourceId::ChannelDivinity));
    std::cout << "[PASS] test_short_rest_resource_ration" << std::endl;
}

void test_refill_by_rest_kind() {
    Combatant c("Fighter", Team::Party);
    c.resource(ResourceId::SecondWind) = ResourcePool{0, 1};
    c.ration(ResourceId::SecondWind).interval = RestKind::Short;
    c.resource(ResourceId::ArcaneRecovery) = ResourcePool{0, 1};
    c.ration(ResourceId::ArcaneRecovery).interval = RestKind::Long;
    c.set_spell_slots({2});
    c.spend_slot(1);

    c.refill_resources(RestKind::Short);
    assert(c.resource(ResourceId::SecondWind).remaining == 1);
    assert(c.resource(ResourceId::ArcaneRecovery).remaining == 0);
    assert(c.slot_count(1) == 1);

    c.refill_resources(RestKind::Long);
    assert(c.resource(ResourceId::ArcaneRecovery).remaining == 1);
    assert(c.slot_count(1) == 2);
    std::cout << "[PASS] test_refill_by_rest_kind" << std::endl;
}

int main() {
    std::cout << "=== Ration Tests ===" << std::endl;

    test_front_loaded_schedule();
    test_back_loaded_schedule();
    test_allotments_sum_to_total();
    test_remaining_after();
    test_zero_encounters();
    test_slot_ration_reserve();
    test_short_rest_resource_ration();
    test_refill_by_rest_kind();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
