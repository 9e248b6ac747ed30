/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_FILE_ENTRIES_HPP
#define BLOBSIFT_FILE_ENTRIES_HPP

#include <cstdint>
#include <string>

// one FASTA record, sequence lines joined
struct fasta_entry {
    std::string seqid;     // first word of the header
    std::string header;    // full header line without '>'
    std::string seq;
};

// one four line FASTQ record
struct fastq_entry {
    std::string seqid;     // read name without mate suffix
    std::string header;    // full header line without '@'
    std::string seq;
    std::string qual;
};

// the parts of a SAM/BAM/CRAM record needed to link reads to sequences
struct alignment_entry {
    std::string qname;
    std::string rname;     // empty for unmapped reads
    int64_t pos = 0;       // 1-based
    int mapq = 0;
    int flag = 0;

    bool mapped() const { return !rname.empty(); }
};

#endif //BLOBSIFT_FILE_ENTRIES_HPP
