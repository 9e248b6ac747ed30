/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "blob_dir.hpp"

#include <stdexcept>
#include <unordered_set>

#include "errors.hpp"
#include "file_io.hpp"

blob_dir::blob_dir(std::filesystem::path path)
    : dir(std::move(path)), metadata(dataset_meta::load(dir)), record_count(0) {

    if (!metadata.has_field(IDENTIFIER_FIELD) || !has_values(IDENTIFIER_FIELD)) {
        throw data_model_error("Dataset has no '" + std::string(IDENTIFIER_FIELD) +
                               "' field: " + dir.string());
    }

    // the identifier field fixes the record count
    auto doc = file_io::read_json(file_io::find_document(dir, IDENTIFIER_FIELD));
    const Json::Value& values = doc["values"];
    if (!values.isArray()) {
        throw data_model_error("Identifier field has no values array: " + dir.string());
    }
    record_count = values.size();

    std::unordered_set<std::string> seen;
    for (const auto& value : values) {
        if (!seen.insert(value.asString()).second) {
            throw data_model_error("Duplicate identifier '" + value.asString() +
                                   "' in dataset: " + dir.string());
        }
    }

    if (metadata.to_json().isMember("records") && metadata.records() != record_count) {
        throw data_model_error("Dataset declares " + std::to_string(metadata.records()) +
                               " records but has " + std::to_string(record_count) +
                               " identifiers: " + dir.string());
    }
}

bool blob_dir::has_values(const std::string& field_id) const {
    return !file_io::find_document(dir, field_id).empty();
}

const field& blob_dir::fetch_field(const std::string& field_id) {
    auto cached = cache.find(field_id);
    if (cached != cache.end()) {
        return *cached->second;
    }

    if (!metadata.has_field(field_id)) {
        throw std::runtime_error("Field not present in dataset: " + field_id);
    }

    auto doc_path = file_io::find_document(dir, field_id);
    if (doc_path.empty()) {
        throw std::runtime_error("No values document for field '" + field_id + "' in " +
                                 dir.string());
    }

    Json::Value meta = metadata.field_meta(field_id);
    auto type = parse_field_type(meta.get("type", "").asString());
    if (field_id == IDENTIFIER_FIELD) {
        type = field_type::IDENTIFIER;
    }
    if (!type) {
        throw data_model_error("Field '" + field_id + "' has unknown type '" +
                               meta.get("type", "").asString() + "'");
    }

    auto loaded = std::make_unique<field>(
        field::from_json(field_id, *type, file_io::read_json(doc_path), meta, record_count));
    const field& ref = *loaded;
    cache.emplace(field_id, std::move(loaded));
    return ref;
}

const field* blob_dir::try_fetch_field(const std::string& field_id) {
    if (!metadata.has_field(field_id) || metadata.is_metadata_only(field_id) ||
        !has_values(field_id)) {
        return nullptr;
    }
    return &fetch_field(field_id);
}
