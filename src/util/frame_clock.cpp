/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "util/frame_clock.hpp"

#include <cmath>
#include <stdexcept>

FrameClock::FrameClock(duration delta) : delta_(delta), now_(clock::now()) {
    if (delta_.count() <= 0) {
        throw std::invalid_argument("FrameClock: step must be positive");
    }
}

FrameClock::duration FrameClock::step_for_rate(double hz) {
    if (!(hz > 0.0)) {
        throw std::invalid_argument("FrameClock: rate must be positive");
    }
    return duration(static_cast<int64_t>(std::llround(1e9 / hz)));
}

FrameClock::duration FrameClock::tick() {
    const auto t = clock::now();
    const auto frame_time = std::chrono::duration_cast<duration>(t - now_);
    now_ = t;
    advance(frame_time);
    return frame_time;
}

void FrameClock::advance(duration frame_time) {
    if (frame_time.count() > 0) {
        accumulator_ += frame_time;
    }
}

bool FrameClock::consume() {
    if (accumulator_ < delta_) {
        return false;
    }
    accumulator_ -= delta_;
    elapsed_ += delta_;
    steps_++;
    return true;
}
