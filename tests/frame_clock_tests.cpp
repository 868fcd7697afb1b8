/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <cmath>
#include <cstdio>
#include <random>
#include <stdexcept>

#include "util/frame_clock.hpp"

namespace {

using namespace std::chrono_literals;
using duration = FrameClock::duration;

uint32_t drain(FrameClock &clock) {
    uint32_t n = 0;
    while (clock.consume()) {
        n++;
    }
    return n;
}

bool test_step_for_rate() {
    if (FrameClock::step_for_rate(60.0) != duration(16666667)) return false;
    if (FrameClock::step_for_rate(50.0) != 20ms) return false;
    if (FrameClock::step_for_rate(1000.0) != 1ms) return false;
    try {
        (void)FrameClock::step_for_rate(0.0);
        return false;
    } catch (const std::invalid_argument &) {
    }
    try {
        const FrameClock bad(duration(0));
        (void)bad;
        return false;
    } catch (const std::invalid_argument &) {
    }
    return true;
}

bool test_three_ticks_of_20ms_at_60hz() {
    FrameClock clock(FrameClock::step_for_rate(60.0));
    uint32_t updates = 0;
    duration total{0};
    for (int i = 0; i < 3; i++) {
        clock.advance(20ms);
        total += 20ms;
        updates += drain(clock);
    }

    const auto expected = static_cast<uint32_t>(total / clock.delta());
    if (expected != 3) return false;
    if (updates != expected) return false;
    if (clock.steps() != 3) return false;
    // 60ms - 3 * 16666667ns
    if (clock.accumulator() != duration(9999999)) return false;
    if (clock.elapsed() != duration(50000001)) return false;
    return true;
}

bool test_per_tick_update_counts() {
    FrameClock clock(10ms);
    clock.advance(4ms);
    if (drain(clock) != 0) return false;
    clock.advance(6ms);
    if (drain(clock) != 1) return false;
    // A long stall produces several updates in one tick.
    clock.advance(35ms);
    if (drain(clock) != 3) return false;
    if (clock.accumulator() != 5ms) return false;
    return clock.steps() == 4;
}

bool test_accumulator_invariant_random() {
    std::mt19937 rng(1234u);
    std::uniform_int_distribution<int64_t> frame_ns(0, 80'000'000);

    for (int rate : {30, 60, 144, 240}) {
        FrameClock clock(FrameClock::step_for_rate(rate));
        duration total{0};
        uint64_t updates = 0;

        for (int i = 0; i < 2000; i++) {
            const duration dt(frame_ns(rng));
            clock.advance(dt);
            total += dt;
            updates += drain(clock);

            if (clock.accumulator() < duration(0) || clock.accumulator() >= clock.delta()) return false;
            // Integer nanoseconds: simulated time plus the remainder equals real time exactly.
            if (clock.elapsed() + clock.accumulator() != total) return false;
            if (updates != static_cast<uint64_t>(total / clock.delta())) return false;
            if (total - clock.elapsed() >= clock.delta()) return false;
        }
        if (clock.steps() != updates) return false;
    }
    return true;
}

bool test_non_positive_frame_time_ignored() {
    FrameClock clock(10ms);
    clock.advance(-5ms);
    clock.advance(0ms);
    if (clock.accumulator() != 0ms) return false;
    if (clock.consume()) return false;
    return true;
}

bool test_wall_clock_tick_accumulates() {
    FrameClock clock(1ms);
    const duration first = clock.tick();
    const duration second = clock.tick();
    if (first < 0ns || second < 0ns) return false;
    return clock.accumulator() == first + second;
}

bool test_seconds_accessors() {
    FrameClock clock(20ms);
    if (std::abs(clock.delta_seconds() - 0.02f) > 1e-7f) return false;
    clock.advance(100ms);
    (void)drain(clock);
    const double e = clock.elapsed_seconds();
    return e > 0.0999 && e < 0.1001;
}

} // namespace

int main() {
    const bool ok_rate = test_step_for_rate();
    const bool ok_scenario = test_three_ticks_of_20ms_at_60hz();
    const bool ok_counts = test_per_tick_update_counts();
    const bool ok_random = test_accumulator_invariant_random();
    const bool ok_negative = test_non_positive_frame_time_ignored();
    const bool ok_wall = test_wall_clock_tick_accumulates();
    const bool ok_seconds = test_seconds_accessors();

    if (!ok_rate) std::fprintf(stderr, "[frame-clock] step for rate failed\n");
    if (!ok_scenario) std::fprintf(stderr, "[frame-clock] 3 x 20ms at 60Hz failed\n");
    if (!ok_counts) std::fprintf(stderr, "[frame-clock] per-tick update counts failed\n");
    if (!ok_random) std::fprintf(stderr, "[frame-clock] accumulator invariant failed\n");
    if (!ok_negative) std::fprintf(stderr, "[frame-clock] non-positive frame time failed\n");
    if (!ok_wall) std::fprintf(stderr, "[frame-clock] wall clock tick failed\n");
    if (!ok_seconds) std::fprintf(stderr, "[frame-clock] seconds accessors failed\n");

    if (!(ok_rate && ok_scenario && ok_counts && ok_random && ok_negative && ok_wall && ok_seconds)) return 1;
    std::fprintf(stderr, "[frame-clock] all tests passed\n");
    return 0;
}
