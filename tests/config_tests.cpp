/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/config.hpp"

namespace {

AppConfig parse(std::initializer_list<const char *> args) {
    std::vector<const char *> argv{"vk-orbit"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

bool rejects(std::initializer_list<const char *> args) {
    try {
        (void)parse(args);
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

bool test_defaults() {
    const AppConfig cfg = parse({});
    if (cfg.width != 1280 || cfg.height != 720) return false;
    if (cfg.sim_rate_hz != 60.0) return false;
    if (cfg.msaa_cap != 8) return false;
    if (cfg.vsync || !cfg.overlay || cfg.show_help) return false;

    const RendererConfig r = cfg.renderer();
    return r.sample_cap == 8 && r.prefer_mailbox;
}

bool test_all_flags() {
    const AppConfig cfg =
        parse({"--width=1920", "--height=1080", "--fps=144", "--msaa=4", "--vsync", "--no-overlay", "--validation"});
    if (cfg.width != 1920 || cfg.height != 1080) return false;
    if (cfg.sim_rate_hz != 144.0) return false;
    if (cfg.msaa_cap != 4) return false;
    if (!cfg.vsync || cfg.overlay || !cfg.validation) return false;

    const RendererConfig r = cfg.renderer();
    if (r.sample_cap != 4 || r.prefer_mailbox) return false;

    if (!parse({"--help"}).show_help) return false;
    if (!parse({"-h"}).show_help) return false;
    if (parse({"--fps=29.97"}).sim_rate_hz != 29.97) return false;
    return true;
}

bool test_rejects_bad_input() {
    if (!rejects({"--bogus"})) return false;
    if (!rejects({"--width"})) return false;
    if (!rejects({"--width="})) return false;
    if (!rejects({"--width=0"})) return false;
    if (!rejects({"--width=-5"})) return false;
    if (!rejects({"--width=12px"})) return false;
    if (!rejects({"--height=abc"})) return false;
    if (!rejects({"--fps=0"})) return false;
    if (!rejects({"--fps=-60"})) return false;
    if (!rejects({"--fps=5000"})) return false;
    if (!rejects({"--msaa=1"})) return false;
    if (!rejects({"--msaa=3"})) return false;
    if (!rejects({"--msaa=128"})) return false;
    if (!rejects({"--vsync=1"})) return false;
    if (!rejects({"width=640"})) return false;
    return true;
}

bool test_usage_lists_flags() {
    const std::string u = usage();
    for (const char *flag : {"--width", "--height", "--fps", "--msaa", "--vsync", "--no-overlay", "--validation"}) {
        if (u.find(flag) == std::string::npos) return false;
    }
    return true;
}

} // namespace

int main() {
    const bool ok_defaults = test_defaults();
    const bool ok_flags = test_all_flags();
    const bool ok_reject = test_rejects_bad_input();
    const bool ok_usage = test_usage_lists_flags();

    if (!ok_defaults) std::fprintf(stderr, "[config] defaults failed\n");
    if (!ok_flags) std::fprintf(stderr, "[config] flag parsing failed\n");
    if (!ok_reject) std::fprintf(stderr, "[config] invalid input rejection failed\n");
    if (!ok_usage) std::fprintf(stderr, "[config] usage text failed\n");

    if (!(ok_defaults && ok_flags && ok_reject && ok_usage)) return 1;
    std::fprintf(stderr, "[config] all tests passed\n");
    return 0;
}
