/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_FILETYPE_DETECTOR_HPP
#define BLOBSIFT_FILETYPE_DETECTOR_HPP

// standard
#include <filesystem>
#include <string>
#include <tuple>

enum class filetype {
    FASTA, FASTQ, SAM, BAM, CRAM, UNKNOWN
};

std::string filetype_name(filetype type);

/**
 * Sniffs the format of companion and alignment files from their first bytes.
 * Gzip and BGZF input is inspected after decompression.
 */
class filetype_detector {
public:
    /**
     * @return (file type, compressed)
     * @throws std::runtime_error if the file cannot be opened
     */
    std::tuple<filetype, bool> detect_filetype(const std::filesystem::path& filepath);

    /**
     * Classify decompressed leading content
     */
    static filetype classify(const std::string& head);
};

#endif //BLOBSIFT_FILETYPE_DETECTOR_HPP
