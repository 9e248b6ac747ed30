/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_UTILITY_HPP
#define BLOBSIFT_UTILITY_HPP

// standard
#include <chrono>
#include <string>
#include <vector>

namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // progress messages are only printed when enabled (--progress)
    void progress(const std::string& message);
    void set_progress_enabled(bool enabled);
    bool progress_enabled();
}

namespace util {
    /**
     * Split a string on a single delimiter, keeping empty tokens
     */
    std::vector<std::string> split(const std::string& str, char delim);

    /**
     * Split a string on any run of whitespace, dropping empty tokens
     */
    std::vector<std::string> split_whitespace(const std::string& str);

    std::string trim(const std::string& str);

    bool is_digits(const std::string& str);

    bool ends_with(const std::string& str, const std::string& suffix);
}

#endif //BLOBSIFT_UTILITY_HPP
