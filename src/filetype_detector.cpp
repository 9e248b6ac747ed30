/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "filetype_detector.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

#include <zlib.h>

namespace {

constexpr size_t SNIFF_BYTES = 512;

bool is_sam_header_tag(const std::string& head) {
    for (const char* tag : {"@HD", "@SQ", "@RG", "@PG", "@CO"}) {
        if (head.compare(0, 3, tag) == 0) {
            return true;
        }
    }
    return false;
}

bool is_base(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'A': case 'C': case 'G': case 'T': case 'N':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

std::string filetype_name(filetype type) {
    switch (type) {
        case filetype::FASTA: return "FASTA";
        case filetype::FASTQ: return "FASTQ";
        case filetype::SAM:   return "SAM";
        case filetype::BAM:   return "BAM";
        case filetype::CRAM:  return "CRAM";
        case filetype::UNKNOWN: break;
    }
    return "UNKNOWN";
}

filetype filetype_detector::classify(const std::string& head) {
    if (head.size() < 2) {
        return filetype::UNKNOWN;
    }
    if (head.compare(0, 4, "CRAM") == 0) {
        return filetype::CRAM;
    }
    if (head.size() >= 4 && head.compare(0, 4, std::string("BAM\1", 4)) == 0) {
        return filetype::BAM;
    }
    if (head[0] == '>') {
        return filetype::FASTA;
    }
    if (head[0] != '@') {
        return filetype::UNKNOWN;
    }

    std::string first_line = head.substr(0, head.find('\n'));

    // SAM header lines are tab separated, FASTQ read names usually are not
    if (is_sam_header_tag(head) && first_line.find('\t') != std::string::npos) {
        return filetype::SAM;
    }

    size_t newline = head.find('\n');
    if (newline != std::string::npos && newline + 1 < head.size() && is_base(head[newline + 1])) {
        return filetype::FASTQ;
    }
    return filetype::UNKNOWN;
}

std::tuple<filetype, bool> filetype_detector::detect_filetype(const std::filesystem::path& filepath) {
    // gzread passes uncompressed files through, gzdirect tells them apart
    gzFile gzfile = gzopen(filepath.string().c_str(), "rb");
    if (!gzfile) {
        throw std::runtime_error("Failed to open file: " + filepath.string());
    }

    std::array<char, SNIFF_BYTES> buffer{};
    int bytes_read = gzread(gzfile, buffer.data(), static_cast<unsigned>(buffer.size()));
    bool compressed = gzdirect(gzfile) == 0;
    gzclose(gzfile);

    if (bytes_read < 0) {
        throw std::runtime_error("Failed to read file: " + filepath.string());
    }

    std::string head(buffer.data(), static_cast<size_t>(bytes_read));
    return std::make_tuple(classify(head), compressed);
}
