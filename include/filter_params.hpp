/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_FILTER_PARAMS_HPP
#define BLOBSIFT_FILTER_PARAMS_HPP

// standard
#include <map>
#include <string>
#include <vector>

#include "dataset_meta.hpp"
#include "diagnostics.hpp"

/**
 * Recognised parameters of one field, e.g. {"Min": "1000", "Inv": "true"}
 */
using field_filter = std::map<std::string, std::string>;

/**
 * field_id -> recognised parameters
 */
using filter_params = std::map<std::string, field_filter>;

struct param_parse_result {
    filter_params params;
    diagnostics diag;
};

/**
 * Parameter names accepted for a field type
 */
const std::vector<std::string>& valid_params(field_type type);

/**
 * Strip a URL down to its query part, percent-decode it and split on '&'
 */
std::vector<std::string> split_query_string(const std::string& query);

/**
 * Decode %XX escapes; malformed escapes are kept verbatim
 */
std::string percent_decode(const std::string& str);

/**
 * Parse "fieldId--Param=value" strings into per-field parameter maps.
 * Malformed strings, unknown fields and parameters invalid for the field type
 * are dropped with a warning.
 * @param strings Direct parameter strings (--param)
 * @param query_string Optional URL query string (--query-string), appended after strings
 */
param_parse_result parse_filter_params(const std::vector<std::string>& strings,
                                       const std::string& query_string,
                                       const dataset_meta& meta);

#endif // BLOBSIFT_FILTER_PARAMS_HPP
