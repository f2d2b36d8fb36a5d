#include "engine/dice.hpp"
#include <iostream>
#include <cassert>
#include <cmath>

using namespace d20;

void test_d20_range() {
    DiceRoller roller(12345);

    for (int i = 0; i < 10000; ++i) {
        u32 roll = roller.roll(20);
        assert(roll >= 1 && roll <= 20);
    }
    std::cout << "[PASS] test_d20_range" << std::endl;
}

void test_distribution() {
    DiceRoller roller(42);
    int counts[21] = {0};

    const int iterations = 200000;
    for (int i = 0; i < iterations; ++i) {
        counts[roller.roll(20)]++;
    }

    // Each face should appear roughly 1/20 of the time
    double expected = iterations / 20.0;
    for (int i = 1; i <= 20; ++i) {
        double diff = std::abs(counts[i] - expected) / expected;
        assert(diff < 0.05);
    }
    std::cout << "[PASS] test_distribution" << std::endl;
}

void test_dice_expression_bounds() {
    DiceRoller roller(7);
    const Dice fireball(8, 6);

    i64 total = 0;
    const int iterations = 20000;
    for (int i = 0; i < iterations; ++i) {
        i32 r = roller.roll(fireball);
        assert(r >= 8 && r <= 48);
        total += r;
    }

    double mean = static_cast<double>(total) / iterations;
    assert(std::abs(mean - fireball.average()) < 0.2);
    std::cout << "[PASS] test_dice_expression_bounds (mean: " << mean << ")" << std::endl;
}

void test_reroll_low_results() {
    DiceRoller plain(99);
    DiceRoller reroll(99);

    i64 plain_total = 0;
    i64 reroll_total = 0;
    const int iterations = 50000;
    for (int i = 0; i < iterations; ++i) {
        plain_total += plain.roll(Dice(2, 6));
        reroll_total += reroll.roll(Dice(2, 6, 2));
    }

    // Great weapon fighting raises 2d6 from 7.0 to about 8.33
    double plain_mean = static_cast<double>(plain_total) / iterations;
    double reroll_mean = static_cast<double>(reroll_total) / iterations;
    assert(std::abs(plain_mean - 7.0) < 0.1);
    assert(std::abs(reroll_mean - 8.33) < 0.1);
    std::cout << "[PASS] test_reroll_low_results (" << plain_mean << " -> " << reroll_mean << ")" << std::endl;
}

void test_advantage() {
    DiceRoller roller(2024);

    i64 adv = 0, disadv = 0, both = 0;
    const int iterations = 50000;
    for (int i = 0; i < iterations; ++i) {
        adv += roller.roll_d20(true, false);
        disadv += roller.roll_d20(false, true);
        both += roller.roll_d20(true, true);
    }

    // Expected means: 13.825 with advantage, 7.175 with disadvantage, 10.5 when they cancel
    assert(std::abs(static_cast<double>(adv) / iterations - 13.825) < 0.1);
    assert(std::abs(static_cast<double>(disadv) / iterations - 7.175) < 0.1);
    assert(std::abs(static_cast<double>(both) / iterations - 10.5) < 0.1);
    std::cout << "[PASS] test_advantage" << std::endl;
}

void test_pick_index_and_chance() {
    DiceRoller roller(5);

    int hits = 0;
    for (int i = 0; i < 10000; ++i) {
        u32 idx = roller.pick_index(3);
        assert(idx < 3);
        if (roller.chance(0.25)) ++hits;
    }
    assert(hits > 2250 && hits < 2750);
    assert(roller.pick_index(0) == 0);
    std::cout << "[PASS] test_pick_index_and_chance" << std::endl;
}

void test_seed_reproducibility() {
    DiceRoller a(1234);
    DiceRoller b(1234);
    for (int i = 0; i < 1000; ++i) {
        assert(a.next() == b.next());
    }

    // Seed 0 maps to a fixed default stream
    DiceRoller zero_a(0);
    DiceRoller zero_b;
    assert(zero_a.next() == zero_b.next());
    std::cout << "[PASS] test_seed_reproducibility" << std::endl;
}

void test_derived_streams() {
    assert(derive_seed(42, 0) == derive_seed(42, 0));
    assert(derive_seed(42, 0) != derive_seed(42, 1));
    assert(derive_seed(42, 7) != derive_seed(43, 7));

    DiceRoller day_a(derive_seed(42, 3));
    DiceRoller day_b(derive_seed(42, 3));
    for (int i = 0; i < 100; ++i) {
        assert(day_a.roll(20) == day_b.roll(20));
    }
    std::cout << "[PASS] test_derived_streams" << std::endl;
}

int main() {
    std::cout << "=== Dice Tests ===" << std::endl;

    test_d20_range();
    test_distribution();
    test_dice_expression_bounds();
    test_reroll_low_results();
    test_advantage();
    test_pick_index_and_chance();
    test_seed_reproducibility();
    test_derived_streams();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
