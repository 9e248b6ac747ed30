/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "utility.hpp"

// standard
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string YELLOW = "\033[33m";
    const std::string RED = "\033[31m";

    static bool show_progress = false;

    // Internal helper to get timestamp
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t current_time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&current_time), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void info(const std::string& message) {
        std::cout << "[BLOBSIFT] " << get_timestamp() << " - " << message << std::endl;
    }

    void warning(const std::string& message) {
        std::cout << YELLOW << "[BLOBSIFT] " << get_timestamp() << " - WARNING: " << message << RESET << std::endl;
    }

    void error(const std::string& message) {
        std::cerr << RED << "[BLOBSIFT] " << get_timestamp() << " - ERROR: " << message << RESET << std::endl;
    }

    void progress(const std::string& message) {
        if (show_progress) {
            info(message);
        }
    }

    void set_progress_enabled(bool enabled) {
        show_progress = enabled;
    }

    bool progress_enabled() {
        return show_progress;
    }
}

namespace util {
    std::vector<std::string> split(const std::string& str, char delim) {
        std::vector<std::string> tokens;
        std::stringstream ss(str);
        std::string token;

        while (std::getline(ss, token, delim)) {
            tokens.push_back(token);
        }
        // getline drops a trailing empty token
        if (!str.empty() && str.back() == delim) {
            tokens.emplace_back();
        }

        return tokens;
    }

    std::vector<std::string> split_whitespace(const std::string& str) {
        std::vector<std::string> tokens;
        std::istringstream ss(str);
        std::string token;
        while (ss >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string trim(const std::string& str) {
        size_t start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, end - start + 1);
    }

    bool is_digits(const std::string& str) {
        return !str.empty() && std::all_of(str.begin(), str.end(),
            [](unsigned char c) { return std::isdigit(c); });
    }

    bool ends_with(const std::string& str, const std::string& suffix) {
        return str.size() >= suffix.size() &&
               str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}
