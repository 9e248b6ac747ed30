/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "sequence_reader.hpp"

std::string header_seqid(const std::string& header) {
    size_t end = header.find_first_of(" \t");
    return end == std::string::npos ? header : header.substr(0, end);
}

std::string strip_mate_suffix(const std::string& name) {
    if (name.size() > 2 && name[name.size() - 2] == '/' &&
        (name.back() == '1' || name.back() == '2')) {
        return name.substr(0, name.size() - 2);
    }
    return name;
}

// ============================================================================
// fasta_reader
// ============================================================================

fasta_reader::fasta_reader(const std::filesystem::path& path)
    : lines(path), eof_reached(false) {}

bool fasta_reader::read_next(fasta_entry& entry) {
    std::string line;

    // the header of the next record is read ahead while collecting sequence lines
    if (pending_header.empty()) {
        while (true) {
            if (!lines.next(line)) {
                eof_reached = true;
                return false;
            }
            if (line.empty()) continue;
            if (line[0] != '>') {
                error_message = "Expected FASTA header at line " +
                                std::to_string(lines.get_current_line());
                eof_reached = true;
                return false;
            }
            pending_header = line.substr(1);
            break;
        }
    }

    entry.header = pending_header;
    entry.seqid = header_seqid(entry.header);
    entry.seq.clear();
    pending_header.clear();

    while (lines.next(line)) {
        if (!line.empty() && line[0] == '>') {
            pending_header = line.substr(1);
            return true;
        }
        entry.seq += line;
    }
    eof_reached = true;
    return true;
}

bool fasta_reader::has_next() {
    return !eof_reached || !pending_header.empty();
}

std::string fasta_reader::get_error_message() {
    return error_message;
}

size_t fasta_reader::get_current_line() {
    return lines.get_current_line();
}

// ============================================================================
// fastq_reader
// ============================================================================

fastq_reader::fastq_reader(const std::filesystem::path& path)
    : lines(path), eof_reached(false) {}

bool fastq_reader::read_next(fastq_entry& entry) {
    std::string header;
    do {
        if (!lines.next(header)) {
            eof_reached = true;
            return false;
        }
    } while (header.empty());

    std::string plus;
    if (header[0] != '@' || !lines.next(entry.seq) || !lines.next(plus) ||
        !lines.next(entry.qual) || plus.empty() || plus[0] != '+') {
        error_message = "Malformed FASTQ record ending at line " +
                        std::to_string(lines.get_current_line());
        eof_reached = true;
        return false;
    }

    entry.header = header.substr(1);
    entry.seqid = strip_mate_suffix(header_seqid(entry.header));
    return true;
}

bool fastq_reader::has_next() {
    return !eof_reached;
}

std::string fastq_reader::get_error_message() {
    return error_message;
}

size_t fastq_reader::get_current_line() {
    return lines.get_current_line();
}
