/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_SUMMARY_HPP
#define BLOBSIFT_SUMMARY_HPP

// standard
#include <filesystem>
#include <memory>
#include <vector>

// jsoncpp
#include <json/json.h>

#include "blob_dir.hpp"
#include "diagnostics.hpp"
#include "section/section.hpp"

namespace summary {

using section_list = std::vector<std::unique_ptr<section::section>>;

struct summary_result {
    Json::Value doc;     // {"summaryStats": {<title>: ..., "stats": {...}}}
    diagnostics diag;
};

/**
 * Built-in sections in output order:
 * taxonomy, baseComposition, hits, busco, readMapping
 */
section_list default_sections();

/**
 * Run every section over the retained records and derive the overall stats.
 * Sections that cannot be resolved, or whose fields are missing, are skipped
 * with a warning.
 * @throws data_model_error if a resolved field is inconsistent with the dataset
 */
summary_result summarise(blob_dir& dataset, const index_list& indices,
                         const summary_options& options, const section_list& sections);

summary_result summarise(blob_dir& dataset, const index_list& indices,
                         const summary_options& options);

/**
 * noHit, target and spanOverN50 from the hits block; empty without one.
 * A literal "target" bucket used for the target fraction is removed from hits.
 */
Json::Value derive_stats(Json::Value& sections);

/**
 * total span / N50 to 3 significant figures, integral when at least 100
 */
Json::Value span_over_n50(double span, double n50);

} // namespace summary

#endif // BLOBSIFT_SUMMARY_HPP
