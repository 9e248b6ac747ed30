/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "companion/fasta.hpp"

#include <stdexcept>

#include "file_io.hpp"
#include "filetype_detector.hpp"
#include "sequence_reader.hpp"
#include "utility.hpp"

namespace companion {

std::filesystem::path fasta::apply_filter(const identifier_set& identifiers,
                                          const std::filesystem::path& source,
                                          const companion_options& options) const {
    filetype_detector detector;
    auto [type, gzipped] = detector.detect_filetype(source);
    if (type != filetype::FASTA) {
        throw std::runtime_error("Not a FASTA file (" + filetype_name(type) + "): " +
                                 source.string());
    }

    auto out_path = output_path(source, options);
    file_io::line_writer out(out_path, gzipped);

    fasta_reader reader(source);
    fasta_entry entry;
    size_t total = 0;
    size_t kept = 0;
    while (reader.read_next(entry)) {
        total++;
        if (!identifiers.count(entry.seqid)) continue;
        out.write_line(">" + entry.header);
        out.write_line(entry.seq);
        kept++;
    }
    if (!reader.get_error_message().empty()) {
        throw std::runtime_error(reader.get_error_message() + " in " + source.string());
    }
    out.close();

    logging::info("Kept " + std::to_string(kept) + " of " + std::to_string(total) +
                  " sequences in " + out_path.string());
    return out_path;
}

} // namespace companion
