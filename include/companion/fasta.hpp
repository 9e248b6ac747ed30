/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_COMPANION_FASTA_HPP
#define BLOBSIFT_COMPANION_FASTA_HPP

#include "companion/companion.hpp"

namespace companion {

/**
 * Keep FASTA sequences whose header id is retained
 */
class fasta : public companion_filter {
public:
    std::string flag() const override { return "fasta"; }

    std::filesystem::path apply_filter(const identifier_set& identifiers,
                                       const std::filesystem::path& source,
                                       const companion_options& options) const override;
};

} // namespace companion

#endif // BLOBSIFT_COMPANION_FASTA_HPP
