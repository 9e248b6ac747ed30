/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "section/busco.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>

#include "errors.hpp"
#include "utility.hpp"

namespace section {

namespace {

constexpr const char* BUSCO_SUFFIX = "_busco";

std::string slot_string(const slot_value& slot) {
    if (const auto* s = std::get_if<std::string>(&slot)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&slot)) {
        return std::to_string(*i);
    }
    return std::to_string(std::get<double>(slot));
}

// tuple position holding the BUSCO status
size_t status_slot(const multiarray_data& arr) {
    auto it = std::find(arr.headers.begin(), arr.headers.end(), "status");
    if (it != arr.headers.end()) {
        return static_cast<size_t>(std::distance(arr.headers.begin(), it));
    }
    return arr.category_slot == 0 ? 1 : 0;
}

double percent(size_t count, size_t total) {
    return total == 0 ? 0.0 : 100.0 * static_cast<double>(count) / static_cast<double>(total);
}

} // anonymous namespace

std::optional<field_roles> busco::resolve(const dataset_meta& meta, const summary_options&,
                                          diagnostics& diag) const {
    field_roles roles;
    for (const auto& field_id : meta.list_fields()) {
        if (util::ends_with(field_id, BUSCO_SUFFIX) && !meta.is_metadata_only(field_id)) {
            roles[field_id] = field_id;
        }
    }
    if (roles.empty()) {
        diag.warn("Skipping 'busco' summary, no BUSCO fields in dataset");
        return std::nullopt;
    }
    return roles;
}

Json::Value busco::summarise(const index_list& indices, const section_fields& fields,
                             const summary_options&, const dataset_meta&,
                             const Json::Value&) const {
    Json::Value block(Json::objectValue);

    for (const auto& [lineage, f] : fields) {
        const auto* arr = f->as_multiarray();
        if (!arr) {
            throw data_model_error("Field '" + f->id() + "' is not a multiarray field");
        }
        size_t slot = status_slot(*arr);

        std::set<std::string> complete, duplicated, fragmented;
        std::map<std::string, size_t> complete_copies;
        for (size_t i : indices) {
            for (const auto& tuple : arr->values[i]) {
                if (slot >= tuple.size()) continue;
                auto key = static_cast<size_t>(std::get<int64_t>(tuple[arr->category_slot]));
                const std::string& busco_id = arr->keys.at(key);
                std::string status = slot_string(tuple[slot]);

                if (status == "Complete") {
                    complete.insert(busco_id);
                    complete_copies[busco_id]++;
                } else if (status == "Duplicated") {
                    complete.insert(busco_id);
                    duplicated.insert(busco_id);
                } else if (status == "Fragmented") {
                    fragmented.insert(busco_id);
                }
            }
        }

        // a complete BUSCO found on more than one retained record is duplicated
        for (const auto& [busco_id, copies] : complete_copies) {
            if (copies > 1) {
                duplicated.insert(busco_id);
            }
        }
        for (const auto& busco_id : complete) {
            fragmented.erase(busco_id);
        }

        size_t n_complete = complete.size();
        size_t n_duplicated = duplicated.size();
        size_t n_single = n_complete - n_duplicated;
        size_t n_fragmented = fragmented.size();

        size_t total = n_complete + n_fragmented;
        const Json::Value& count = f->meta()["count"];
        if (count.isIntegral() && count.asUInt64() >= total) {
            total = static_cast<size_t>(count.asUInt64());
        }
        size_t n_missing = total - n_complete - n_fragmented;

        std::ostringstream str;
        str << std::fixed << std::setprecision(1)
            << "C:" << percent(n_complete, total) << "%"
            << "[S:" << percent(n_single, total) << "%"
            << ",D:" << percent(n_duplicated, total) << "%]"
            << ",F:" << percent(n_fragmented, total) << "%"
            << ",M:" << percent(n_missing, total) << "%"
            << ",n:" << total;

        Json::Value lineage_block(Json::objectValue);
        lineage_block["total"] = static_cast<Json::UInt64>(total);
        lineage_block["complete"] = static_cast<Json::UInt64>(n_complete);
        lineage_block["single"] = static_cast<Json::UInt64>(n_single);
        lineage_block["duplicated"] = static_cast<Json::UInt64>(n_duplicated);
        lineage_block["fragmented"] = static_cast<Json::UInt64>(n_fragmented);
        lineage_block["missing"] = static_cast<Json::UInt64>(n_missing);
        lineage_block["string"] = str.str();
        block[lineage] = lineage_block;
    }

    return block;
}

} // namespace section
