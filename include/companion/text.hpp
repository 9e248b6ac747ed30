/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_COMPANION_TEXT_HPP
#define BLOBSIFT_COMPANION_TEXT_HPP

#include "companion/companion.hpp"

namespace companion {

/**
 * Keep lines of a delimited text file whose id column is retained;
 * the header line is always kept
 */
class text : public companion_filter {
public:
    std::string flag() const override { return "text"; }
    std::vector<std::string> required_options() const override {
        return {"text-delimiter", "text-header", "text-id-column"};
    }

    std::filesystem::path apply_filter(const identifier_set& identifiers,
                                       const std::filesystem::path& source,
                                       const companion_options& options) const override;
};

} // namespace companion

#endif // BLOBSIFT_COMPANION_TEXT_HPP
