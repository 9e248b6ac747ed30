/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "filter_params.hpp"

#include <algorithm>

#include "utility.hpp"

const std::vector<std::string>& valid_params(field_type type) {
    static const std::vector<std::string> variable = {"Min", "Max", "Inv"};
    static const std::vector<std::string> category = {"Keys", "Inv"};
    static const std::vector<std::string> multiarray = {"Keys", "MinLength", "MaxLength", "Inv"};
    static const std::vector<std::string> none;

    switch (type) {
        case field_type::VARIABLE:   return variable;
        case field_type::CATEGORY:   return category;
        case field_type::MULTIARRAY: return multiarray;
        case field_type::IDENTIFIER: return none;
    }
    return none;
}

std::string percent_decode(const std::string& str) {
    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(str[i]);
    }
    return out;
}

std::vector<std::string> split_query_string(const std::string& query) {
    std::string qstr = query;

    // drop everything up to the last '?'
    size_t question = qstr.rfind('?');
    if (question != std::string::npos) {
        qstr = qstr.substr(question + 1);
    }
    // drop the fragment
    size_t hash = qstr.find('#');
    if (hash != std::string::npos) {
        qstr.erase(hash);
    }

    return util::split(percent_decode(qstr), '&');
}

namespace {

/**
 * Split "fieldId--Param=value"; requires exactly one '=' and exactly one "--" in the key
 */
bool split_param_string(const std::string& str, std::string& field_id,
                        std::string& param, std::string& value) {
    if (std::count(str.begin(), str.end(), '=') != 1) {
        return false;
    }
    size_t eq = str.find('=');
    std::string key = str.substr(0, eq);
    value = str.substr(eq + 1);

    size_t sep = key.find("--");
    if (sep == std::string::npos || key.find("--", sep + 2) != std::string::npos) {
        return false;
    }
    field_id = key.substr(0, sep);
    param = key.substr(sep + 2);
    return true;
}

} // anonymous namespace

param_parse_result parse_filter_params(const std::vector<std::string>& strings,
                                       const std::string& query_string,
                                       const dataset_meta& meta) {
    param_parse_result result;

    std::vector<std::string> all = strings;
    if (!query_string.empty()) {
        auto from_query = split_query_string(query_string);
        all.insert(all.end(), from_query.begin(), from_query.end());
    }

    for (const auto& str : all) {
        std::string field_id, param, value;
        if (!split_param_string(str, field_id, param, value)) {
            result.diag.warn("Skipping string '" + str + "', not a valid parameter");
            continue;
        }

        if (!meta.has_field(field_id)) {
            result.diag.warn("Skipping field '" + field_id + "', not present in dataset");
            continue;
        }
        if (meta.is_metadata_only(field_id)) {
            result.diag.warn("Skipping field '" + field_id + "', it has no values to filter");
            continue;
        }

        auto type = meta.field_type_of(field_id);
        if (!type) {
            result.diag.warn("Skipping field '" + field_id + "', unknown field type");
            continue;
        }

        const auto& valid = valid_params(*type);
        if (std::find(valid.begin(), valid.end(), param) == valid.end()) {
            result.diag.warn("'" + param + "' is not a valid parameter for field '" +
                             field_id + "'");
            continue;
        }

        result.params[field_id][param] = value;
    }

    return result;
}
