/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_SUBCALL_FILTER_HPP
#define BLOBSIFT_SUBCALL_FILTER_HPP

#include "subcall/subcall.hpp"

#include "companion/companion.hpp"
#include "field.hpp"
#include "section/section.hpp"

namespace subcall {

/**
 * Filter subcommand: select records of a BlobDir and write the selection.
 *
 * Pipeline:
 * 1. Parses field parameters (--param, --query-string)
 * 2. Narrows records by parameters, then by --json and --list selections
 * 3. Writes a filtered BlobDir (--output)
 * 4. Filters companion files (--fasta, --fastq, --text)
 * 5. Writes a table (--table) and a summary (--summary)
 */
class filter : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "filter"; }
    std::string description() const override {
        return "Filter a BlobDir dataset and summarise the selection";
    }

    static summary_options make_summary_options(const cxxopts::ParseResult& args);
    static companion_options make_companion_options(const cxxopts::ParseResult& args);

private:
    index_list select_records(const cxxopts::ParseResult& args);
    void write_dataset(const cxxopts::ParseResult& args, const index_list& indices);
    void filter_companions(const cxxopts::ParseResult& args, const index_list& indices);
    void write_table(const cxxopts::ParseResult& args, const index_list& indices);
    void write_summary(const cxxopts::ParseResult& args, const index_list& indices);
};

} // namespace subcall

#endif // BLOBSIFT_SUBCALL_FILTER_HPP
