/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

// Fixed-timestep accumulator. Wall-clock time is added with tick()/advance(),
// consume() hands it out again in whole steps of delta().
class FrameClock {
public:
    using clock = std::chrono::steady_clock;
    using duration = std::chrono::nanoseconds;

    explicit FrameClock(duration delta);

    // Step length for a simulation rate in Hz (60 -> 16666667ns).
    static duration step_for_rate(double hz);

    // Samples the wall clock and accumulates the time since the previous sample.
    duration tick();
    void advance(duration frame_time);

    // Takes one step out of the accumulator. Returns false once less than delta remains.
    bool consume();

    duration delta() const { return delta_; }
    duration accumulator() const { return accumulator_; }
    duration elapsed() const { return elapsed_; }
    uint64_t steps() const { return steps_; }

    float delta_seconds() const { return std::chrono::duration<float>(delta_).count(); }
    double elapsed_seconds() const { return std::chrono::duration<double>(elapsed_).count(); }

private:
    duration delta_;
    duration accumulator_{0};
    duration elapsed_{0};
    clock::time_point now_;
    uint64_t steps_ = 0;
};
