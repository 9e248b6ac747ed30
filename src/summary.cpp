/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "summary.hpp"

#include "section/base_composition.hpp"
#include "section/busco.hpp"
#include "section/hits.hpp"
#include "section/read_mapping.hpp"
#include "section/taxonomy.hpp"
#include "utility.hpp"

namespace summary {

namespace {

constexpr const char* NO_HIT = "no-hit";
constexpr const char* TARGET = "target";

double fraction(double part, double whole) {
    return whole > 0.0 ? section::round_to(part / whole, 3) : 0.0;
}

} // anonymous namespace

section_list default_sections() {
    section_list sections;
    sections.push_back(std::make_unique<section::taxonomy>());
    sections.push_back(std::make_unique<section::base_composition>());
    sections.push_back(std::make_unique<section::hits>());
    sections.push_back(std::make_unique<section::busco>());
    sections.push_back(std::make_unique<section::read_mapping>());
    return sections;
}

summary_result summarise(blob_dir& dataset, const index_list& indices,
                         const summary_options& options, const section_list& sections) {
    summary_result result;
    Json::Value blocks(Json::objectValue);

    for (const auto& sec : sections) {
        std::string title = sec->title();
        auto roles = sec->resolve(dataset.meta(), options, result.diag);
        if (!roles) continue;

        section::section_fields fields;
        bool complete = true;
        for (const auto& [role, field_id] : *roles) {
            const field* f = dataset.try_fetch_field(field_id);
            if (!f) {
                result.diag.warn("Skipping '" + title + "' summary, field '" + field_id +
                                 "' not present in dataset");
                complete = false;
                break;
            }
            fields[role] = f;
        }
        if (!complete) continue;

        blocks[title] = sec->summarise(indices, fields, options, dataset.meta(), blocks);
        logging::progress("Summarised section '" + title + "'");
    }

    Json::Value stats = derive_stats(blocks);
    blocks["stats"] = stats;

    result.doc = Json::Value(Json::objectValue);
    result.doc["summaryStats"] = blocks;
    return result;
}

summary_result summarise(blob_dir& dataset, const index_list& indices,
                         const summary_options& options) {
    return summarise(dataset, indices, options, default_sections());
}

Json::Value derive_stats(Json::Value& sections) {
    Json::Value stats(Json::objectValue);
    if (!sections.isMember("hits")) {
        return stats;
    }

    Json::Value& hits = sections["hits"];
    double span = hits["total"]["span"].asDouble();

    double nohit_span = 0.0;
    if (hits.isMember(NO_HIT)) {
        nohit_span = hits[NO_HIT]["span"].asDouble();
        stats["noHit"] = fraction(nohit_span, span);
    } else {
        stats["noHit"] = 0;
    }

    // target taxon named by the taxonomy section, else a literal "target" bucket
    std::string target_taxon;
    if (sections.isMember("taxonomy")) {
        const Json::Value& taxonomy = sections["taxonomy"];
        if (taxonomy.isObject() && taxonomy.isMember(TARGET) && taxonomy[TARGET].isString()) {
            target_taxon = taxonomy[TARGET].asString();
        }
    }
    if (!target_taxon.empty() && hits.isMember(target_taxon)) {
        stats["target"] = fraction(hits[target_taxon]["span"].asDouble(), span - nohit_span);
    } else if (hits.isMember(TARGET)) {
        stats["target"] = fraction(hits[TARGET]["span"].asDouble(), span - nohit_span);
        hits.removeMember(TARGET);
    } else {
        stats["target"] = 0;
    }

    stats["spanOverN50"] = span_over_n50(span, hits["total"]["n50"].asDouble());
    return stats;
}

Json::Value span_over_n50(double span, double n50) {
    if (n50 <= 0.0) {
        return 0;
    }
    double ratio = section::round_significant(span / n50, 3);
    if (ratio >= 100.0) {
        return static_cast<Json::Int64>(ratio);
    }
    return ratio;
}

} // namespace summary
