/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_SUBCALL_HPP
#define BLOBSIFT_SUBCALL_HPP

#include <filesystem>
#include <memory>
#include <string>

// filter parameters carry comma separated key lists, so repeated options are never split
#ifndef CXXOPTS_VECTOR_DELIMITER
#define CXXOPTS_VECTOR_DELIMITER '\0'
#endif
#include <cxxopts.hpp>

#include "blob_dir.hpp"

namespace subcall {

/**
 * Base class of the blobsift subcommands. Every subcommand works on one
 * BlobDir given as the DIRECTORY positional argument.
 */
class subcall {
public:
    virtual ~subcall() = default;

    // Option definitions of the subcommand, including add_common_options()
    virtual cxxopts::Options parse_args(int argc, char** argv) = 0;

    /**
     * Check arguments before anything is read.
     * @throws std::runtime_error on missing or contradictory arguments
     */
    virtual void validate(const cxxopts::ParseResult& args) = 0;

    // Subcommand body, run once the dataset is open
    virtual void execute(const cxxopts::ParseResult& args) = 0;

    /**
     * validate, apply the common options, open the dataset, then execute
     */
    void run(const cxxopts::ParseResult& args);

    static void add_common_options(cxxopts::Options& options);

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

protected:
    std::unique_ptr<blob_dir> dataset;

    /**
     * Open the BlobDir named by DIRECTORY; reads meta.json and the identifiers
     * @throws std::runtime_error, data_model_error
     */
    void open_dataset(const std::filesystem::path& dir);

private:
    static void apply_common_options(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // BLOBSIFT_SUBCALL_HPP
