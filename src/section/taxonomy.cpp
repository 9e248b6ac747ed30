/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "section/taxonomy.hpp"

namespace section {

std::optional<field_roles> taxonomy::resolve(const dataset_meta&, const summary_options&,
                                             diagnostics&) const {
    return field_roles{};
}

Json::Value taxonomy::summarise(const index_list&, const section_fields&,
                                const summary_options& options, const dataset_meta& meta,
                                const Json::Value&) const {
    Json::Value block(Json::objectValue);
    const Json::Value& taxon = meta.taxon();
    if (!taxon.isObject()) {
        return block;
    }

    for (const auto& name : taxon.getMemberNames()) {
        block[name] = taxon[name];
    }
    if (taxon[options.rank].isString()) {
        block["target"] = taxon[options.rank];
    }
    return block;
}

} // namespace section
