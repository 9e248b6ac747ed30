/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_BAM_READER_HPP
#define BLOBSIFT_BAM_READER_HPP

// standard
#include <filesystem>
#include <memory>
#include <string>

// htslib
#include <htslib/sam.h>

// class
#include "file_entries.hpp"
#include "record_reader.hpp"

/**
 * Reads SAM, BAM and CRAM through htslib; the format is detected by htslib.
 * Secondary and supplementary alignments are reported like primary ones.
 */
class bam_reader : public record_reader<alignment_entry> {
    public:
        explicit bam_reader(const std::filesystem::path& path);
        bool read_next(alignment_entry& entry) override;
        bool has_next() override;
        std::string get_error_message() override;
        size_t get_current_line() override;

    private:
        struct hts_deleter {
            void operator()(samFile* f) const { sam_close(f); }
            void operator()(sam_hdr_t* h) const { sam_hdr_destroy(h); }
            void operator()(bam1_t* b) const { bam_destroy1(b); }
        };

        std::unique_ptr<samFile, hts_deleter> file;
        std::unique_ptr<sam_hdr_t, hts_deleter> header;
        std::unique_ptr<bam1_t, hts_deleter> record;
        size_t records_read = 0;
        std::string error_message;
        bool eof_reached = false;
};

#endif //BLOBSIFT_BAM_READER_HPP
