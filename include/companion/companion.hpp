/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_COMPANION_HPP
#define BLOBSIFT_COMPANION_HPP

// standard
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "diagnostics.hpp"

using identifier_set = std::unordered_set<std::string>;

struct companion_options {
    std::string suffix = "filtered";
    std::string cov;                 // SAM/BAM/CRAM file linking reads to sequences
    std::string text_delimiter;      // empty splits on whitespace
    bool text_header = false;
    size_t text_id_column = 1;       // 1-based
};

namespace companion {

/**
 * Abstract base class for filters that write a filtered copy of a file
 * belonging to the dataset (assembly, reads, tables), keeping only the
 * entries of retained identifiers.
 */
class companion_filter {
public:
    virtual ~companion_filter() = default;

    /**
     * Command line option selecting the filter, without dashes
     */
    virtual std::string flag() const = 0;

    /**
     * Options that must be set for the filter to run, without dashes
     */
    virtual std::vector<std::string> required_options() const { return {}; }

    /**
     * Write the filtered copy beside source
     * @return path of the filtered file
     * @throws std::runtime_error on unreadable or malformed input
     */
    virtual std::filesystem::path apply_filter(const identifier_set& identifiers,
                                               const std::filesystem::path& source,
                                               const companion_options& options) const = 0;
};

/**
 * Whether a required option has a usable value
 */
bool option_set(const companion_options& options, const std::string& name);

/**
 * "<stem>.<suffix>.<ext>[.gz]" beside source
 */
std::filesystem::path output_path(const std::filesystem::path& source,
                                  const companion_options& options);

/**
 * Registered filters: fasta, fastq, text
 */
std::vector<std::unique_ptr<companion_filter>> default_filters();

/**
 * Run the requested filters (flag -> input files). Filters with a missing
 * required option are skipped with a warning.
 * @return paths of all files written
 */
std::vector<std::filesystem::path> run(
    const std::map<std::string, std::vector<std::string>>& requests,
    const identifier_set& identifiers, const companion_options& options,
    diagnostics& diag);

} // namespace companion

#endif // BLOBSIFT_COMPANION_HPP
