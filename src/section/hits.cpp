/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "section/hits.hpp"

#include "errors.hpp"

namespace section {

namespace {

struct bucket {
    std::vector<double> lengths;
    std::vector<double> gc;
    std::vector<double> cov;
};

Json::Value pair_json(const std::pair<double, double>& values, int decimals) {
    Json::Value arr(Json::arrayValue);
    arr.append(round_to(values.first, decimals));
    arr.append(round_to(values.second, decimals));
    return arr;
}

Json::Value bucket_json(const bucket& b, bool with_cov) {
    double span = 0.0;
    for (double length : b.lengths) {
        span += length;
    }

    Json::Value block(Json::objectValue);
    block["span"] = integral_json(span);
    block["count"] = static_cast<Json::UInt64>(b.lengths.size());
    block["n50"] = integral_json(n50(b.lengths));
    block["gc"] = pair_json(mean_sd(b.gc), 4);
    if (with_cov) {
        block["cov"] = pair_json(mean_sd(b.cov), 3);
    }
    return block;
}

} // anonymous namespace

std::optional<field_roles> hits::resolve(const dataset_meta& meta, const summary_options& options,
                                         diagnostics& diag) const {
    std::string taxrule = options.taxrule;
    if (taxrule.empty()) {
        auto cat = meta.plot_axis("cat");
        if (!cat) {
            diag.warn("Skipping 'hits' summary, no taxrule given and no category plot axis set");
            return std::nullopt;
        }
        // strip the trailing rank: bestsumorder_phylum -> bestsumorder
        taxrule = *cat;
        size_t sep = taxrule.rfind('_');
        if (sep != std::string::npos && sep + 1 < taxrule.size()) {
            taxrule.erase(sep);
        }
    }

    std::string classification = taxrule + "_" + options.rank;
    auto type = meta.field_type_of(classification);
    if (type && *type != field_type::CATEGORY) {
        diag.warn("Skipping 'hits' summary, field '" + classification +
                  "' is not a category field");
        return std::nullopt;
    }

    field_roles roles = {
        {"length", "length"},
        {"gc", "gc"},
        {"hits", classification}
    };
    if (auto y = meta.plot_axis("y")) {
        if (meta.has_field(*y) && !meta.is_metadata_only(*y)) {
            roles["cov"] = *y;
        }
    }
    return roles;
}

Json::Value hits::summarise(const index_list& indices, const section_fields& fields,
                            const summary_options&, const dataset_meta&,
                            const Json::Value&) const {
    const auto& length = variable_values(fields, "length");
    const auto& gc = variable_values(fields, "gc");

    const field* classification = fields.at("hits");
    const auto* cat = classification->as_category();
    if (!cat) {
        throw data_model_error("Field '" + classification->id() + "' is not a category field");
    }

    const std::vector<double>* cov = nullptr;
    if (fields.count("cov")) {
        cov = &variable_values(fields, "cov");
    }

    std::map<std::string, bucket> buckets;
    bucket total;
    for (size_t i : indices) {
        auto& b = buckets[cat->keys.at(cat->values[i])];
        for (bucket* target : {&b, &total}) {
            target->lengths.push_back(length[i]);
            target->gc.push_back(gc[i]);
            if (cov) {
                target->cov.push_back((*cov)[i]);
            }
        }
    }

    Json::Value block(Json::objectValue);
    for (const auto& [name, b] : buckets) {
        block[name] = bucket_json(b, cov != nullptr);
    }
    block["total"] = bucket_json(total, cov != nullptr);
    return block;
}

} // namespace section
