/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_BLOB_DIR_HPP
#define BLOBSIFT_BLOB_DIR_HPP

// standard
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include "dataset_meta.hpp"
#include "field.hpp"

/**
 * A BlobDir dataset on disk: meta.json plus one "<field_id>.json" per field.
 * Fields are loaded lazily and cached for the lifetime of the object.
 */
class blob_dir {
public:
    static constexpr const char* IDENTIFIER_FIELD = "identifiers";

    /**
     * Open a dataset directory and load its metadata
     * @throws std::runtime_error if the directory or meta.json is missing
     * @throws data_model_error if the identifier field is absent or inconsistent
     */
    explicit blob_dir(std::filesystem::path dir);

    const std::filesystem::path& path() const { return dir; }
    const dataset_meta& meta() const { return metadata; }
    size_t records() const { return record_count; }

    bool has_values(const std::string& field_id) const;

    /**
     * Fetch a field, loading its values document on first access
     * @throws std::runtime_error if the field is unknown or has no values document
     * @throws data_model_error if its value count differs from the record count
     */
    const field& fetch_field(const std::string& field_id);

    /**
     * Fetch a field if it exists and has values, nullptr otherwise
     */
    const field* try_fetch_field(const std::string& field_id);

    const field& identifiers() { return fetch_field(IDENTIFIER_FIELD); }

private:
    std::filesystem::path dir;
    dataset_meta metadata;
    size_t record_count;
    std::map<std::string, std::unique_ptr<field>> cache;
};

#endif // BLOBSIFT_BLOB_DIR_HPP
