/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_SECTION_BASE_COMPOSITION_HPP
#define BLOBSIFT_SECTION_BASE_COMPOSITION_HPP

#include "section/section.hpp"

namespace section {

/**
 * Span weighted GC, AT and N fractions (fields: gc, ncount, length)
 */
class base_composition : public section {
public:
    std::string title() const override { return "baseComposition"; }

    std::optional<field_roles> resolve(const dataset_meta& meta, const summary_options& options,
                                       diagnostics& diag) const override;

    Json::Value summarise(const index_list& indices, const section_fields& fields,
                          const summary_options& options, const dataset_meta& meta,
                          const Json::Value& stats_so_far) const override;
};

} // namespace section

#endif // BLOBSIFT_SECTION_BASE_COMPOSITION_HPP
