/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_SECTION_HPP
#define BLOBSIFT_SECTION_HPP

// standard
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// jsoncpp
#include <json/json.h>

#include "dataset_meta.hpp"
#include "diagnostics.hpp"
#include "field.hpp"

struct summary_options {
    std::string rank = "phylum";   // taxonomic rank of the hits and taxonomy sections
    std::string taxrule;           // classification rule, inferred from the plot when empty
};

namespace section {

// role name -> field id, as requested by a section
using field_roles = std::map<std::string, std::string>;

// role name -> loaded field
using section_fields = std::map<std::string, const field*>;

/**
 * Abstract base class for all summary sections.
 *
 * The aggregator calls resolve() first; the returned roles are loaded from
 * the dataset and handed to summarise(). A section that cannot run returns
 * std::nullopt from resolve() after recording the reason.
 */
class section {
public:
    virtual ~section() = default;

    /**
     * Key of the section block in the summary document
     */
    virtual std::string title() const = 0;

    /**
     * Fields the section needs, by role
     */
    virtual std::optional<field_roles> resolve(const dataset_meta& meta,
                                               const summary_options& options,
                                               diagnostics& diag) const = 0;

    /**
     * Compute the section block over the retained records
     * @param stats_so_far Blocks of the sections that ran before this one
     */
    virtual Json::Value summarise(const index_list& indices, const section_fields& fields,
                                  const summary_options& options, const dataset_meta& meta,
                                  const Json::Value& stats_so_far) const = 0;
};

// --- shared numeric helpers ---

double round_to(double value, int decimals);

/**
 * Round to a number of significant figures (232.56 -> 233 for 3)
 */
double round_significant(double value, int digits);

/**
 * N50 of a set of lengths: the length at which half of the total span is
 * covered by sequences at least that long
 */
double n50(std::vector<double> lengths);

/**
 * [mean, population standard deviation]; [0, 0] for no values
 */
std::pair<double, double> mean_sd(const std::vector<double>& values);

/**
 * Values of a variable field by role
 * @throws data_model_error if the field is not a variable field
 */
const std::vector<double>& variable_values(const section_fields& fields, const std::string& role);

/**
 * Integral JSON number from a double (spans, counts)
 */
Json::Value integral_json(double value);

} // namespace section

#endif // BLOBSIFT_SECTION_HPP
