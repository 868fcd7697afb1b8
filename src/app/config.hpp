/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include "gfx/renderer.hpp"

struct AppConfig {
    uint32_t width = 1280;
    uint32_t height = 720;
    std::string title = "vk-orbit";

    double sim_rate_hz = 60.0;
    uint32_t msaa_cap = 8;
    bool vsync = false; // FIFO only; otherwise mailbox when available
#ifndef NDEBUG
    bool validation = true;
#else
    bool validation = false;
#endif
    bool overlay = true;
    bool show_help = false;

    RendererConfig renderer() const;
};

// Accepts --width=N --height=N --fps=HZ --msaa=N --vsync --no-overlay --validation --help.
// Throws std::invalid_argument on unknown flags or malformed values.
AppConfig parse_args(int argc, const char *const *argv);

const char *usage();
