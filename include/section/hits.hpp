/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_SECTION_HITS_HPP
#define BLOBSIFT_SECTION_HITS_HPP

#include "section/section.hpp"

namespace section {

/**
 * Span, count, N50, GC and coverage per taxon of a classification field.
 *
 * The classification field is "<taxrule>_<rank>"; without an explicit taxrule
 * it is inferred from the category plot axis by dropping its trailing rank.
 * Coverage comes from the y plot axis when the dataset has one.
 */
class hits : public section {
public:
    std::string title() const override { return "hits"; }

    std::optional<field_roles> resolve(const dataset_meta& meta, const summary_options& options,
                                       diagnostics& diag) const override;

    Json::Value summarise(const index_list& indices, const section_fields& fields,
                          const summary_options& options, const dataset_meta& meta,
                          const Json::Value& stats_so_far) const override;
};

} // namespace section

#endif // BLOBSIFT_SECTION_HITS_HPP
