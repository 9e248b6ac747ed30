/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_DIAGNOSTICS_HPP
#define BLOBSIFT_DIAGNOSTICS_HPP

#include <string>
#include <utility>
#include <vector>

/**
 * Collects recoverable warnings produced while parsing, filtering or summarising.
 * Library code records warnings here; the command line layer decides how to report them.
 */
class diagnostics {
public:
    void warn(std::string message) { warnings_.push_back(std::move(message)); }

    const std::vector<std::string>& warnings() const { return warnings_; }
    bool empty() const { return warnings_.empty(); }
    size_t size() const { return warnings_.size(); }

    bool contains(const std::string& fragment) const;

    // Append all warnings of another collector
    void merge(const diagnostics& other);

    // Forward all warnings to logging::warning
    void report() const;

private:
    std::vector<std::string> warnings_;
};

#endif // BLOBSIFT_DIAGNOSTICS_HPP
