/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <stdexcept>

#include "app/app.hpp"
#include "app/config.hpp"

int main(int argc, char **argv) {
    try {
        const AppConfig cfg = parse_args(argc, argv);
        if (cfg.show_help) {
            std::cout << usage();
            return 0;
        }

        App app(cfg);
        app.run();
        return 0;
    } catch (const std::invalid_argument &e) {
        std::cerr << "Fatal: " << e.what() << "\n" << usage();
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
