/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// cxxopts
#include <cxxopts.hpp>

// class
#include "config.hpp"
#include "utility.hpp"
#include "subcall/subcall.hpp"
#include "subcall/assign.hpp"
#include "subcall/cluster.hpp"

void showVersion(std::ostream& _str) {
    _str << "parentage v" << parentage_VERSION_MAJOR;
    _str << "." << parentage_VERSION_MINOR << ".";
    _str << parentage_VERSION_PATCH << " - ";
    _str << "Assign de novo gene predictions to projected ";
    _str << "parent genes";
    _str << std::endl;
}

std::vector<std::unique_ptr<subcall::subcall>> make_subcalls() {
    std::vector<std::unique_ptr<subcall::subcall>> subcalls;
    subcalls.push_back(std::make_unique<subcall::assign>());
    subcalls.push_back(std::make_unique<subcall::cluster>());
    return subcalls;
}

void showUsage(std::ostream& _str,
               const std::vector<std::unique_ptr<subcall::subcall>>& subcalls) {
    showVersion(_str);
    _str << "\nUsage: parentage <command> [options]\n\nCommands:\n";
    for (const auto& sc : subcalls) {
        _str << "  " << sc->name() << "\t" << sc->description() << "\n";
    }
    _str << "\nRun 'parentage <command> --help' for command options." << std::endl;
}

int main(int argc, char** argv) {
    auto subcalls = make_subcalls();

    if (argc < 2) {
        showUsage(std::cerr, subcalls);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        showUsage(std::cout, subcalls);
        return 0;
    }
    if (command == "-v" || command == "--version") {
        showVersion(std::cout);
        return 0;
    }

    subcall::subcall* selected = nullptr;
    for (const auto& sc : subcalls) {
        if (sc->name() == command) {
            selected = sc.get();
        }
    }

    if (selected == nullptr) {
        logging::error("Unknown command: " + command);
        showUsage(std::cerr, subcalls);
        return 1;
    }

    try {
        cxxopts::Options options = selected->parse_args(argc - 1, argv + 1);
        auto result = options.parse(argc - 1, argv + 1);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        selected->run(result);

    } catch(const cxxopts::exceptions::exception& e) {
        logging::error(e.what());
        return 1;
    } catch(const std::exception& e) {
        logging::error(e.what());
        return 1;
    }

    return 0;
}
