/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_COMPANION_FASTQ_HPP
#define BLOBSIFT_COMPANION_FASTQ_HPP

#include "companion/companion.hpp"

namespace companion {

/**
 * Keep reads aligned to retained sequences. Read to sequence assignments
 * come from the alignment file given with --cov.
 */
class fastq : public companion_filter {
public:
    std::string flag() const override { return "fastq"; }
    std::vector<std::string> required_options() const override { return {"cov"}; }

    std::filesystem::path apply_filter(const identifier_set& identifiers,
                                       const std::filesystem::path& source,
                                       const companion_options& options) const override;

    /**
     * Names of reads with an alignment to one of the identifiers
     * @throws std::runtime_error if the alignment file cannot be read
     */
    static identifier_set aligned_reads(const std::filesystem::path& alignments,
                                        const identifier_set& identifiers);
};

} // namespace companion

#endif // BLOBSIFT_COMPANION_FASTQ_HPP
