/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "companion/fastq.hpp"

#include <stdexcept>

#include "bam_reader.hpp"
#include "file_io.hpp"
#include "filetype_detector.hpp"
#include "sequence_reader.hpp"
#include "utility.hpp"

namespace companion {

identifier_set fastq::aligned_reads(const std::filesystem::path& alignments,
                                    const identifier_set& identifiers) {
    identifier_set reads;
    bam_reader reader(alignments);
    alignment_entry entry;
    while (reader.read_next(entry)) {
        if (entry.mapped() && identifiers.count(entry.rname)) {
            reads.insert(strip_mate_suffix(entry.qname));
        }
    }
    if (!reader.get_error_message().empty()) {
        throw std::runtime_error(reader.get_error_message() + " in " + alignments.string());
    }
    logging::progress("Found " + std::to_string(reads.size()) +
                      " reads aligned to retained sequences");
    return reads;
}

std::filesystem::path fastq::apply_filter(const identifier_set& identifiers,
                                          const std::filesystem::path& source,
                                          const companion_options& options) const {
    filetype_detector detector;
    auto [type, gzipped] = detector.detect_filetype(source);
    if (type != filetype::FASTQ) {
        throw std::runtime_error("Not a FASTQ file (" + filetype_name(type) + "): " +
                                 source.string());
    }

    identifier_set reads = aligned_reads(options.cov, identifiers);

    auto out_path = output_path(source, options);
    file_io::line_writer out(out_path, gzipped);

    fastq_reader reader(source);
    fastq_entry entry;
    size_t total = 0;
    size_t kept = 0;
    while (reader.read_next(entry)) {
        total++;
        if (!reads.count(entry.seqid)) continue;
        out.write_line("@" + entry.header);
        out.write_line(entry.seq);
        out.write_line("+");
        out.write_line(entry.qual);
        kept++;
    }
    if (!reader.get_error_message().empty()) {
        throw std::runtime_error(reader.get_error_message() + " in " + source.string());
    }
    out.close();

    logging::info("Kept " + std::to_string(kept) + " of " + std::to_string(total) +
                  " reads in " + out_path.string());
    return out_path;
}

} // namespace companion
