/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "dataset_writer.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

#include "file_io.hpp"
#include "utility.hpp"

namespace dataset_writer {

namespace {

Json::Value number_json(double value, bool integral) {
    if (integral) {
        return Json::Value(static_cast<Json::Int64>(value));
    }
    return Json::Value(value);
}

Json::Value string_list_json(const std::vector<std::string>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& item : items) {
        arr.append(item);
    }
    return arr;
}

} // anonymous namespace

field subset_field(const field& source, const index_list& indices,
                   const std::vector<std::string>* fixed_keys) {
    switch (source.type()) {
        case field_type::IDENTIFIER: {
            const auto& values = source.as_identifier()->values;
            std::vector<std::string> subset;
            subset.reserve(indices.size());
            for (size_t i : indices) {
                subset.push_back(values.at(i));
            }
            return field::make_identifier(source.id(), std::move(subset), source.meta());
        }
        case field_type::VARIABLE: {
            const auto* var = source.as_variable();
            std::vector<double> subset;
            subset.reserve(indices.size());
            for (size_t i : indices) {
                subset.push_back(var->values.at(i));
            }
            return field::make_variable(source.id(), std::move(subset), var->integral,
                                        source.meta());
        }
        case field_type::CATEGORY: {
            // re-resolve by key name so the output key table only holds retained keys
            std::vector<std::string> names;
            names.reserve(indices.size());
            for (size_t i : indices) {
                names.push_back(std::get<std::string>(source.expand(i)));
            }
            return field::collect_category(source.id(), names, fixed_keys, source.meta());
        }
        case field_type::MULTIARRAY: {
            const auto* arr = source.as_multiarray();
            std::vector<entry_list> expanded;
            expanded.reserve(indices.size());
            for (size_t i : indices) {
                expanded.push_back(std::get<entry_list>(source.expand(i)));
            }
            return field::collect_multiarray(source.id(), expanded, arr->category_slot,
                                             arr->headers, fixed_keys, source.meta());
        }
    }
    throw std::logic_error("Unhandled field type for field '" + source.id() + "'");
}

write_result write(blob_dir& source, const std::filesystem::path& outdir,
                   const index_list& indices) {
    if (indices.empty()) {
        throw std::invalid_argument("No records retained, not writing an empty dataset to " +
                                    outdir.string());
    }

    std::filesystem::create_directories(outdir);

    const dataset_meta& source_meta = source.meta();
    write_result result{source_meta, {}, {}};
    dataset_meta& out_meta = result.meta;

    std::string out_id = outdir.filename().string();
    if (out_id.empty()) {
        out_id = outdir.parent_path().filename().string();
    }
    out_meta.set_id(out_id);
    out_meta.set_origin(source_meta.dataset_id());
    out_meta.set_records(indices.size());

    // key tables of fields already written, for children sharing their parent's keys
    std::unordered_map<std::string, std::vector<std::string>> written_keys;

    for (const auto& field_id : source_meta.list_fields()) {
        if (source_meta.is_metadata_only(field_id)) continue;

        if (!source.has_values(field_id)) {
            result.diag.warn("Field '" + field_id + "' has no values document, not written");
            out_meta.remove_field(field_id);
            continue;
        }

        const field& full = source.fetch_field(field_id);
        Json::Value attrs = source_meta.own_meta(field_id);

        const std::vector<std::string>* fixed_keys = nullptr;
        std::string parent = source_meta.parent_of(field_id);
        if (!parent.empty()) {
            auto it = written_keys.find(parent);
            if (it != written_keys.end()) {
                fixed_keys = &it->second;
            }
        }

        field subset = subset_field(full, indices, fixed_keys);

        switch (subset.type()) {
            case field_type::IDENTIFIER:
                break;
            case field_type::VARIABLE: {
                const auto* var = subset.as_variable();
                auto [lo, hi] = std::minmax_element(var->values.begin(), var->values.end());
                Json::Value range(Json::arrayValue);
                range.append(number_json(*lo, var->integral));
                range.append(number_json(*hi, var->integral));
                attrs["range"] = range;

                if (field_id == "length") {
                    double span = std::accumulate(var->values.begin(), var->values.end(), 0.0);
                    out_meta.set_assembly_value("span", number_json(span, var->integral));
                    out_meta.set_assembly_value("scaffold-count",
                        static_cast<Json::UInt64>(var->values.size()));
                }
                break;
            }
            case field_type::CATEGORY:
            case field_type::MULTIARRAY: {
                written_keys[field_id] = subset.keys();
                if (attrs.isMember("keys")) {
                    attrs["keys"] = string_list_json(subset.keys());
                }
                break;
            }
        }

        out_meta.set_field_meta(field_id, attrs);
        file_io::write_json(outdir / (field_id + ".json"), subset.values_to_json());
        result.fields_written.push_back(field_id);
        logging::progress("Wrote field '" + field_id + "'");
    }

    file_io::write_json(outdir / "meta.json", out_meta.to_json());
    return result;
}

} // namespace dataset_writer
