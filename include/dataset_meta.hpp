/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_DATASET_META_HPP
#define BLOBSIFT_DATASET_META_HPP

// standard
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// jsoncpp
#include <json/json.h>

#include "field.hpp"

/**
 * Position of a field entry inside the "fields" tree of meta.json
 */
struct field_descriptor {
    std::string id;
    std::string parent;             // empty for top level entries
    std::string link;               // "children" or "data" relation to the parent
    bool metadata_only = false;     // group entry without backing values ("children" marker)

    // (array name, position) steps from the document root to this entry
    std::vector<std::pair<std::string, Json::ArrayIndex>> path;
};

/**
 * Dataset level metadata of a BlobDir (meta.json)
 *
 * Holds the record count, origin, plot axes and the field descriptor tree.
 * Group entries carry a "children" array and have no values document; data
 * entries may carry a "data" array of dependent fields. Attributes of group
 * entries (type, scale, range, ...) are inherited by their descendants.
 */
class dataset_meta {
public:
    explicit dataset_meta(Json::Value doc);

    /**
     * Load meta.json or meta.json.gz from a dataset directory
     * @throws std::runtime_error if the directory or document is missing
     */
    static dataset_meta load(const std::filesystem::path& dir);

    std::string dataset_id() const;
    size_t records() const;
    std::string origin() const;

    // Field ids in depth-first order of the descriptor tree
    const std::vector<std::string>& list_fields() const { return field_order; }

    bool has_field(const std::string& field_id) const;
    const field_descriptor& descriptor(const std::string& field_id) const;

    /**
     * Own attributes of a field entry merged over the attributes inherited from its groups
     */
    Json::Value field_meta(const std::string& field_id) const;

    /**
     * Own attributes only (without "children"/"data")
     */
    Json::Value own_meta(const std::string& field_id) const;

    std::optional<field_type> field_type_of(const std::string& field_id) const;
    std::string parent_of(const std::string& field_id) const;
    bool is_metadata_only(const std::string& field_id) const;

    // Plot axis assignment ("x", "y", "z", "cat")
    std::optional<std::string> plot_axis(const std::string& axis) const;

    const Json::Value& taxon() const { return doc["taxon"]; }
    const Json::Value& assembly() const { return doc["assembly"]; }

    const Json::Value& to_json() const { return doc; }

    // --- mutation, used when deriving a filtered dataset ---

    void set_id(const std::string& id);
    void set_records(size_t records);
    void set_origin(const std::string& origin);
    void set_assembly_value(const std::string& key, const Json::Value& value);

    /**
     * Replace the own attributes of a field entry, keeping its "children"/"data" arrays
     */
    void set_field_meta(const std::string& field_id, const Json::Value& attributes);

    /**
     * Drop a field entry. Entries nested below it take its place in the
     * parent array and keep the attributes they inherited from it.
     */
    void remove_field(const std::string& field_id);

private:
    Json::Value doc;
    std::vector<std::string> field_order;
    std::unordered_map<std::string, field_descriptor> descriptors;

    void reindex();
    void index_fields(const Json::Value& entries, const std::string& parent,
                      const std::string& link,
                      std::vector<std::pair<std::string, Json::ArrayIndex>> path);

    const Json::Value& entry(const field_descriptor& desc) const;
    Json::Value& entry(const field_descriptor& desc);
};

#endif // BLOBSIFT_DATASET_META_HPP
