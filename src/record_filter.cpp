/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "record_filter.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "errors.hpp"
#include "file_io.hpp"
#include "utility.hpp"

namespace record_filter {

namespace {

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();
constexpr double POS_INF = std::numeric_limits<double>::infinity();

// Non-empty value of a parameter, empty string if absent
std::string param_value(const field_filter& params, const std::string& name) {
    auto it = params.find(name);
    return it == params.end() ? "" : it->second;
}

double parse_number(const field& f, const std::string& param, const std::string& value) {
    std::string trimmed = util::trim(value);
    size_t consumed = 0;
    double number;
    try {
        number = std::stod(trimmed, &consumed);
    } catch (const std::logic_error&) {
        throw invalid_parameter_value(f.id(), param, value);
    }
    if (consumed != trimmed.size()) {
        throw invalid_parameter_value(f.id(), param, value);
    }
    return number;
}

long long parse_integer(const field& f, const std::string& param, const std::string& value) {
    std::string trimmed = util::trim(value);
    size_t consumed = 0;
    long long number;
    try {
        number = std::stoll(trimmed, &consumed);
    } catch (const std::logic_error&) {
        throw invalid_parameter_value(f.id(), param, value);
    }
    if (consumed != trimmed.size()) {
        throw invalid_parameter_value(f.id(), param, value);
    }
    return number;
}

bool in_bounds(double value, double low, double high, bool invert) {
    if (invert) {
        return value < low || value > high;
    }
    return low <= value && value <= high;
}

} // anonymous namespace

index_list all_indices(size_t n) {
    index_list indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    return indices;
}

bool is_inverted(const field_filter& params) {
    return !param_value(params, "Inv").empty();
}

std::unordered_set<size_t> retained_keys(const field& f, const std::string& keys_param, bool invert) {
    std::unordered_set<size_t> listed;
    for (const auto& token : util::split(keys_param, ',')) {
        if (token.empty()) continue;
        if (util::is_digits(token)) {
            // an index beyond any key table matches nothing
            try {
                listed.insert(std::stoul(token));
            } catch (const std::out_of_range&) {
                continue;
            }
        } else {
            listed.insert(f.key_index_of(token));
        }
    }

    if (invert) {
        return listed;
    }

    std::unordered_set<size_t> complement;
    for (size_t i = 0; i < f.keys().size(); ++i) {
        if (!listed.count(i)) {
            complement.insert(i);
        }
    }
    return complement;
}

index_list filter_variable(const field& f, const index_list& indices, const field_filter& params) {
    const auto* var = f.as_variable();
    if (!var) {
        throw std::invalid_argument("Field '" + f.id() + "' is not a variable field");
    }

    double low = NEG_INF;
    double high = POS_INF;
    std::string min = param_value(params, "Min");
    std::string max = param_value(params, "Max");
    if (!min.empty()) low = parse_number(f, "Min", min);
    if (!max.empty()) high = parse_number(f, "Max", max);
    bool invert = is_inverted(params);

    index_list out;
    out.reserve(indices.size());
    for (size_t i : indices) {
        if (in_bounds(var->values[i], low, high, invert)) {
            out.push_back(i);
        }
    }
    return out;
}

index_list filter_category(const field& f, const index_list& indices, const field_filter& params) {
    const auto* cat = f.as_category();
    if (!cat) {
        throw std::invalid_argument("Field '" + f.id() + "' is not a category field");
    }

    std::string keys_param = param_value(params, "Keys");
    if (keys_param.empty()) {
        return indices;
    }

    auto keep = retained_keys(f, keys_param, is_inverted(params));

    index_list out;
    out.reserve(indices.size());
    for (size_t i : indices) {
        if (keep.count(cat->values[i])) {
            out.push_back(i);
        }
    }
    return out;
}

index_list filter_multiarray(const field& f, const index_list& indices, const field_filter& params) {
    const auto* arr = f.as_multiarray();
    if (!arr) {
        throw std::invalid_argument("Field '" + f.id() + "' is not a multiarray field");
    }

    bool invert = is_inverted(params);
    index_list current = indices;

    // length bound
    std::string min_length = param_value(params, "MinLength");
    std::string max_length = param_value(params, "MaxLength");
    if (!min_length.empty() || !max_length.empty()) {
        double low = NEG_INF;
        double high = POS_INF;
        if (!min_length.empty()) low = static_cast<double>(parse_integer(f, "MinLength", min_length));
        if (!max_length.empty()) high = static_cast<double>(parse_integer(f, "MaxLength", max_length));

        index_list out;
        out.reserve(current.size());
        for (size_t i : current) {
            if (in_bounds(static_cast<double>(arr->values[i].size()), low, high, invert)) {
                out.push_back(i);
            }
        }
        current = std::move(out);
    }

    // keys bound
    std::string keys_param = param_value(params, "Keys");
    if (!keys_param.empty()) {
        auto keep = retained_keys(f, keys_param, invert);

        index_list out;
        out.reserve(current.size());
        for (size_t i : current) {
            for (const auto& tuple : arr->values[i]) {
                auto key = static_cast<size_t>(std::get<int64_t>(tuple[arr->category_slot]));
                if (keep.count(key)) {
                    out.push_back(i);
                    break;
                }
            }
        }
        current = std::move(out);
    }

    return current;
}

index_list filter_field(const field& f, const index_list& indices, const field_filter& params) {
    switch (f.type()) {
        case field_type::VARIABLE:   return filter_variable(f, indices, params);
        case field_type::CATEGORY:   return filter_category(f, indices, params);
        case field_type::MULTIARRAY: return filter_multiarray(f, indices, params);
        case field_type::IDENTIFIER: return indices;
    }
    return indices;
}

index_list invert_indices(const index_list& all_records, const index_list& retained) {
    std::unordered_set<size_t> kept(retained.begin(), retained.end());
    index_list out;
    out.reserve(all_records.size() - std::min(all_records.size(), kept.size()));
    for (size_t i : all_records) {
        if (!kept.count(i)) {
            out.push_back(i);
        }
    }
    return out;
}

index_list filter_by_params(blob_dir& dataset, const index_list& indices,
                            const filter_params& params, bool invert_all) {
    index_list current = indices;

    for (const auto& field_id : dataset.meta().list_fields()) {
        auto it = params.find(field_id);
        if (it == params.end()) continue;

        const field& f = dataset.fetch_field(field_id);
        current = filter_field(f, current, it->second);
        logging::progress("Filter on '" + field_id + "' retained " +
                          std::to_string(current.size()) + " records");
    }

    if (invert_all) {
        return invert_indices(indices, current);
    }
    return current;
}

index_list filter_by_identifiers(const std::vector<std::string>& identifiers,
                                 const index_list& indices,
                                 const std::unordered_set<std::string>& selection,
                                 bool invert) {
    index_list out;
    out.reserve(indices.size());
    for (size_t i : indices) {
        bool selected = selection.count(identifiers.at(i)) > 0;
        if (selected != invert) {
            out.push_back(i);
        }
    }
    return out;
}

std::unordered_set<std::string> read_selection_json(const std::filesystem::path& path) {
    Json::Value doc = file_io::read_json(path);
    const Json::Value& ids = doc["identifiers"];
    if (!ids.isArray()) {
        throw std::runtime_error("Selection file has no identifiers array: " + path.string());
    }
    std::unordered_set<std::string> selection;
    for (const auto& id : ids) {
        selection.insert(id.asString());
    }
    return selection;
}

std::unordered_set<std::string> read_identifier_list(const std::filesystem::path& path) {
    std::unordered_set<std::string> selection;
    for (auto token : util::split_whitespace(file_io::read_text(path))) {
        if (token.front() == '>') {
            token.erase(0, 1);
        }
        if (!token.empty()) {
            selection.insert(token);
        }
    }
    return selection;
}

} // namespace record_filter
