/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/config.hpp"

#include <charconv>
#include <stdexcept>
#include <string_view>

namespace {

template <typename T> T parse_number(std::string_view flag, std::string_view text) {
    T value{};
    const auto *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        throw std::invalid_argument(std::string(flag) + ": invalid value '" + std::string(text) + "'");
    }
    return value;
}

uint32_t parse_positive(std::string_view flag, std::string_view text) {
    const auto v = parse_number<uint32_t>(flag, text);
    if (v == 0) {
        throw std::invalid_argument(std::string(flag) + ": must be positive");
    }
    return v;
}

} // namespace

RendererConfig AppConfig::renderer() const {
    RendererConfig r{};
    r.sample_cap = msaa_cap;
    r.prefer_mailbox = !vsync;
    return r;
}

AppConfig parse_args(int argc, const char *const *argv) {
    AppConfig cfg{};

    for (int i = 1; i < argc; i++) {
        const std::string_view arg(argv[i]);
        const auto eq = arg.find('=');
        const std::string_view key = arg.substr(0, eq);
        const std::string_view val = eq == std::string_view::npos ? std::string_view{} : arg.substr(eq + 1);

        if (key == "--width") {
            cfg.width = parse_positive(key, val);
        } else if (key == "--height") {
            cfg.height = parse_positive(key, val);
        } else if (key == "--fps") {
            cfg.sim_rate_hz = parse_number<double>(key, val);
            if (!(cfg.sim_rate_hz > 0.0 && cfg.sim_rate_hz <= 1000.0)) {
                throw std::invalid_argument("--fps: must be in (0, 1000]");
            }
        } else if (key == "--msaa") {
            cfg.msaa_cap = parse_positive(key, val);
            if (cfg.msaa_cap < 2 || cfg.msaa_cap > 64 || (cfg.msaa_cap & (cfg.msaa_cap - 1)) != 0) {
                throw std::invalid_argument("--msaa: must be a power of two in [2, 64]");
            }
        } else if (key == "--vsync" && val.empty()) {
            cfg.vsync = true;
        } else if (key == "--no-overlay" && val.empty()) {
            cfg.overlay = false;
        } else if (key == "--validation" && val.empty()) {
            cfg.validation = true;
        } else if ((key == "--help" || key == "-h") && val.empty()) {
            cfg.show_help = true;
        } else {
            throw std::invalid_argument("unknown argument: " + std::string(arg));
        }
    }
    return cfg;
}

const char *usage() {
    return "usage: vk-orbit [--width=N] [--height=N] [--fps=HZ] [--msaa=N] [--vsync] [--no-overlay] [--validation] [--help]\n";
}
