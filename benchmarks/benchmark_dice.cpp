#include "engine/dice.hpp"
#include <iostream>
#include <algorithm>
#include <chrono>
#include <iomanip>

using namespace d20;

int main() {
    std::cout << "=== Dice Benchmarks ===" << std::endl;
    std::cout << std::endl;

    DiceRoller roller(12345);

    // Benchmark raw d20 rolls
    {
        const u64 iterations = 100'000'000;
        auto start = std::chrono::high_resolution_clock::now();

        u64 sum = 0;
        for (u64 i = 0; i < iterations; ++i) {
            sum += roller.roll(20);
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        double rolls_per_sec = iterations * 1000.0 / std::max<i64>(1, duration.count());

        std::cout << "Raw d20 Rolls:" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(2)
                  << rolls_per_sec / 1e6 << " million/sec" << std::endl;
        std::cout << "  (Sum: " << sum << ")" << std::endl;
        std::cout << std::endl;
    }

    // Benchmark attack rolls with advantage
    {
        const u64 iterations = 50'000'000;
        auto start = std::chrono::high_resolution_clock::now();

        u64 hits = 0;
        for (u64 i = 0; i < iterations; ++i) {
            if (roller.roll_d20(true, false) + 5 >= 15) ++hits;
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        double rolls_per_sec = iterations * 1000.0 / std::max<i64>(1, duration.count());

        std::cout << "Advantage Attack Rolls (+5 vs AC 15):" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(2)
                  << rolls_per_sec / 1e6 << " million/sec" << std::endl;
        std::cout << "  Hit rate: " << std::setprecision(2)
                  << 100.0 * hits / iterations << "%" << std::endl;
        std::cout << std::endl;
    }

    // Benchmark damage expressions (Fireball, Great Weapon Fighting)
    {
        const u64 iterations = 10'000'000;
        const Dice fireball(8, 6);
        const Dice greatsword(2, 6, 2);
        auto start = std::chrono::high_resolution_clock::now();

        i64 total = 0;
        for (u64 i = 0; i < iterations; ++i) {
            total += roller.roll(fireball);
            total += roller.roll(greatsword);
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        double rolls_per_sec = iterations * 1000.0 / std::max<i64>(1, duration.count());

        std::cout << "Damage Expressions (8d6 + 2d6 reroll):" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(2)
                  << rolls_per_sec / 1e6 << " million/sec" << std::endl;
        std::cout << "  Avg total: " << std::setprecision(2)
                  << static_cast<double>(total) / iterations << std::endl;
        std::cout << std::endl;
    }

    return 0;
}
