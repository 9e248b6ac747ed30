/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "bam_reader.hpp"

#include <stdexcept>

bam_reader::bam_reader(const std::filesystem::path& path)
    : file(sam_open(path.c_str(), "r")) {
    if (!file) {
        throw std::runtime_error("Failed to open alignment file: " + path.string());
    }
    header.reset(sam_hdr_read(file.get()));
    if (!header) {
        throw std::runtime_error("Failed to read alignment header: " + path.string());
    }
    record.reset(bam_init1());
    if (!record) {
        throw std::runtime_error("Failed to allocate alignment record");
    }
}

bool bam_reader::read_next(alignment_entry& entry) {
    if (eof_reached) {
        return false;
    }

    // -1 is the regular end of input, anything lower a truncated or corrupt file
    int status = sam_read1(file.get(), header.get(), record.get());
    if (status < 0) {
        eof_reached = true;
        if (status < -1) {
            error_message = "Failed to read alignment record " + std::to_string(records_read + 1);
        }
        return false;
    }
    records_read++;

    const bam1_core_t& core = record->core;
    entry.qname = bam_get_qname(record.get());
    entry.rname = (core.tid >= 0 && !(core.flag & BAM_FUNMAP))
        ? sam_hdr_tid2name(header.get(), core.tid) : "";
    entry.pos = core.pos + 1;
    entry.mapq = core.qual;
    entry.flag = core.flag;
    return true;
}

bool bam_reader::has_next() {
    return !eof_reached;
}

std::string bam_reader::get_error_message() {
    return error_message;
}

size_t bam_reader::get_current_line() {
    return records_read;
}
