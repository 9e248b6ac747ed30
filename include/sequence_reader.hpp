/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_SEQUENCE_READER_HPP
#define BLOBSIFT_SEQUENCE_READER_HPP

// standard
#include <filesystem>
#include <string>

// class
#include "file_entries.hpp"
#include "file_io.hpp"
#include "record_reader.hpp"

/**
 * Reader for plain or gzipped FASTA files; multi-line sequences are joined
 */
class fasta_reader : public record_reader<fasta_entry> {
    public:
        explicit fasta_reader(const std::filesystem::path& path);
        bool read_next(fasta_entry& entry) override;
        bool has_next() override;
        std::string get_error_message() override;
        size_t get_current_line() override;

    private:
        file_io::line_reader lines;
        std::string pending_header;
        std::string error_message;
        bool eof_reached;
};

/**
 * Reader for plain or gzipped four line FASTQ files
 */
class fastq_reader : public record_reader<fastq_entry> {
    public:
        explicit fastq_reader(const std::filesystem::path& path);
        bool read_next(fastq_entry& entry) override;
        bool has_next() override;
        std::string get_error_message() override;
        size_t get_current_line() override;

    private:
        file_io::line_reader lines;
        std::string error_message;
        bool eof_reached;
};

/**
 * First whitespace separated word of a header line
 */
std::string header_seqid(const std::string& header);

/**
 * Read name without a trailing /1 or /2 mate suffix
 */
std::string strip_mate_suffix(const std::string& name);

#endif //BLOBSIFT_SEQUENCE_READER_HPP
