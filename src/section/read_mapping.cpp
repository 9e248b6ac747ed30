/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "section/read_mapping.hpp"

#include "utility.hpp"

namespace section {

namespace {

constexpr const char* COV_SUFFIX = "_cov";
constexpr const char* READ_COV_SUFFIX = "_read_cov";

} // anonymous namespace

std::optional<field_roles> read_mapping::resolve(const dataset_meta& meta, const summary_options&,
                                                 diagnostics& diag) const {
    field_roles roles = {{"length", "length"}};
    bool any_library = false;

    for (const auto& field_id : meta.list_fields()) {
        if (!util::ends_with(field_id, COV_SUFFIX) || util::ends_with(field_id, READ_COV_SUFFIX)) {
            continue;
        }
        if (meta.is_metadata_only(field_id)) continue;

        std::string library = field_id.substr(0, field_id.size() - std::string(COV_SUFFIX).size());
        roles[field_id] = field_id;
        any_library = true;

        std::string read_cov = library + READ_COV_SUFFIX;
        if (meta.has_field(read_cov) && !meta.is_metadata_only(read_cov)) {
            roles[read_cov] = read_cov;
        }
    }

    if (!any_library) {
        diag.warn("Skipping 'readMapping' summary, no coverage fields in dataset");
        return std::nullopt;
    }
    return roles;
}

Json::Value read_mapping::summarise(const index_list& indices, const section_fields& fields,
                                    const summary_options&, const dataset_meta&,
                                    const Json::Value&) const {
    const auto& length = variable_values(fields, "length");

    double span = 0.0;
    for (size_t i : indices) {
        span += length[i];
    }

    Json::Value block(Json::objectValue);
    for (const auto& [role, f] : fields) {
        if (!util::ends_with(role, COV_SUFFIX) || util::ends_with(role, READ_COV_SUFFIX)) {
            continue;
        }
        std::string library = role.substr(0, role.size() - std::string(COV_SUFFIX).size());
        const auto& cov = variable_values(fields, role);

        double weighted = 0.0;
        double covered = 0.0;
        for (size_t i : indices) {
            weighted += cov[i] * length[i];
            if (cov[i] > 0.0) {
                covered += length[i];
            }
        }

        Json::Value library_block(Json::objectValue);
        library_block["cov"] = span > 0.0 ? round_to(weighted / span, 3) : 0.0;
        library_block["coveredFraction"] = span > 0.0 ? round_to(covered / span, 4) : 0.0;

        std::string read_cov = library + READ_COV_SUFFIX;
        if (fields.count(read_cov)) {
            const auto& reads = variable_values(fields, read_cov);
            double mapped = 0.0;
            for (size_t i : indices) {
                mapped += reads[i];
            }
            library_block["mappedReads"] = integral_json(mapped);
        }
        block[library] = library_block;
    }
    return block;
}

} // namespace section
