/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <iostream>
#include <memory>
#include <string>

// class
#include "config.hpp"
#include "utility.hpp"
#include "subcall/filter.hpp"

void showVersion(std::ostream& _str) {
    _str << "blobsift v" << blobsift_VERSION_MAJOR;
    _str << "." << blobsift_VERSION_MINOR << ".";
    _str << blobsift_VERSION_PATCH << " - ";
    _str << "Filter and summarise BlobDir datasets";
    _str << std::endl;
}

void showUsage(std::ostream& _str) {
    _str << "Usage: blobsift <command> [options]" << std::endl << std::endl;
    _str << "Commands:" << std::endl;
    _str << "  filter    Filter a BlobDir dataset and summarise the selection" << std::endl;
    _str << std::endl;
    _str << "Run 'blobsift <command> --help' for the options of a command." << std::endl;
}

std::unique_ptr<subcall::subcall> make_subcall(const std::string& command) {
    if (command == "filter") {
        return std::make_unique<subcall::filter>();
    }
    return nullptr;
}

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            showUsage(std::cerr);
            return 1;
        }

        std::string command = argv[1];
        if (command == "-v" || command == "--version") {
            showVersion(std::cout);
            return 0;
        }
        if (command == "-h" || command == "--help") {
            showUsage(std::cout);
            return 0;
        }

        auto sub = make_subcall(command);
        if (!sub) {
            logging::error("Unknown command: " + command);
            showUsage(std::cerr);
            return 1;
        }

        // the subcommand sees its own name as argv[0]
        auto options = sub->parse_args(argc - 1, argv + 1);
        auto result = options.parse(argc - 1, argv + 1);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        sub->run(result);

    } catch(const cxxopts::exceptions::exception& e) {
        logging::error(e.what());
        return 1;
    } catch(const std::exception& e) {
        logging::error(e.what());
        return 1;
    }

    return 0;
}
