/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "section/base_composition.hpp"

namespace section {

std::optional<field_roles> base_composition::resolve(const dataset_meta&, const summary_options&,
                                                     diagnostics&) const {
    return field_roles{{"gc", "gc"}, {"ncount", "ncount"}, {"length", "length"}};
}

Json::Value base_composition::summarise(const index_list& indices, const section_fields& fields,
                                        const summary_options&, const dataset_meta&,
                                        const Json::Value&) const {
    const auto& gc = variable_values(fields, "gc");
    const auto& ncount = variable_values(fields, "ncount");
    const auto& length = variable_values(fields, "length");

    double span = 0.0;
    double n_bases = 0.0;
    double gc_bases = 0.0;
    for (size_t i : indices) {
        double acgt = length[i] - ncount[i];
        span += length[i];
        n_bases += ncount[i];
        gc_bases += gc[i] * acgt;
    }

    Json::Value block(Json::objectValue);
    if (span <= 0.0) {
        block["gc"] = 0;
        block["at"] = 0;
        block["n"] = 0;
        return block;
    }

    double at_bases = span - n_bases - gc_bases;
    block["gc"] = round_to(gc_bases / span, 4);
    block["at"] = round_to(at_bases / span, 4);
    block["n"] = round_to(n_bases / span, 4);
    return block;
}

} // namespace section
