/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_SECTION_READ_MAPPING_HPP
#define BLOBSIFT_SECTION_READ_MAPPING_HPP

#include "section/section.hpp"

namespace section {

/**
 * Coverage of every "<library>_cov" field, with mapped read totals from the
 * paired "<library>_read_cov" field when present
 */
class read_mapping : public section {
public:
    std::string title() const override { return "readMapping"; }

    std::optional<field_roles> resolve(const dataset_meta& meta, const summary_options& options,
                                       diagnostics& diag) const override;

    Json::Value summarise(const index_list& indices, const section_fields& fields,
                          const summary_options& options, const dataset_meta& meta,
                          const Json::Value& stats_so_far) const override;
};

} // namespace section

#endif // BLOBSIFT_SECTION_READ_MAPPING_HPP
