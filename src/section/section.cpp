/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "section/section.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>

#include "errors.hpp"

namespace section {

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double round_significant(double value, int digits) {
    if (value == 0.0 || !std::isfinite(value)) {
        return value;
    }
    int magnitude = static_cast<int>(std::floor(std::log10(std::fabs(value)))) + 1;
    return round_to(value, digits - magnitude);
}

double n50(std::vector<double> lengths) {
    if (lengths.empty()) {
        return 0.0;
    }
    std::sort(lengths.begin(), lengths.end(), std::greater<double>());
    double total = std::accumulate(lengths.begin(), lengths.end(), 0.0);
    double running = 0.0;
    for (double length : lengths) {
        running += length;
        if (running >= total / 2.0) {
            return length;
        }
    }
    return lengths.back();
}

std::pair<double, double> mean_sd(const std::vector<double>& values) {
    if (values.empty()) {
        return {0.0, 0.0};
    }
    double n = static_cast<double>(values.size());
    double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    double sq = 0.0;
    for (double v : values) {
        sq += (v - mean) * (v - mean);
    }
    return {mean, std::sqrt(sq / n)};
}

const std::vector<double>& variable_values(const section_fields& fields, const std::string& role) {
    const field* f = fields.at(role);
    const auto* var = f->as_variable();
    if (!var) {
        throw data_model_error("Field '" + f->id() + "' is not a variable field");
    }
    return var->values;
}

Json::Value integral_json(double value) {
    return Json::Value(static_cast<Json::Int64>(std::llround(value)));
}

} // namespace section
