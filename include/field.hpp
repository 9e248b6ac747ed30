/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_FIELD_HPP
#define BLOBSIFT_FIELD_HPP

// standard
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// jsoncpp
#include <json/json.h>

/**
 * Ordered record positions; position is the join key across all fields
 */
using index_list = std::vector<size_t>;

/**
 * Field type discriminator
 */
enum class field_type {
    IDENTIFIER,
    VARIABLE,
    CATEGORY,
    MULTIARRAY
};

std::string field_type_name(field_type type);
std::optional<field_type> parse_field_type(const std::string& name);

/**
 * One position of a MultiArray tuple: key index, score or free text
 */
using slot_value = std::variant<int64_t, double, std::string>;
using entry_tuple = std::vector<slot_value>;
using entry_list = std::vector<entry_tuple>;

/**
 * Value of one record in one field.
 * IDENTIFIER -> string, VARIABLE -> double, CATEGORY -> key index (raw) or
 * key string (expanded), MULTIARRAY -> tuples with the category slot as key
 * index (raw) or key string (expanded)
 */
using field_value = std::variant<std::string, double, size_t, entry_list>;

struct identifier_data {
    std::vector<std::string> values;
};

struct variable_data {
    std::vector<double> values;
    bool integral = false;   // written back as integers
};

struct category_data {
    std::vector<size_t> values;       // indices into keys
    std::vector<std::string> keys;
};

struct multiarray_data {
    std::vector<entry_list> values;
    std::vector<std::string> keys;    // vocabulary of the category slot
    size_t category_slot = 0;
    std::vector<std::string> headers; // optional labels of tuple positions
};

/**
 * One named per-record column of a dataset with its descriptor metadata.
 * Fields are immutable once constructed; filtering builds new fields.
 */
class field {
public:
    static field make_identifier(std::string id, std::vector<std::string> values,
                                 Json::Value meta = Json::Value(Json::objectValue));

    static field make_variable(std::string id, std::vector<double> values, bool integral,
                               Json::Value meta = Json::Value(Json::objectValue));

    static field make_category(std::string id, std::vector<size_t> values,
                               std::vector<std::string> keys,
                               Json::Value meta = Json::Value(Json::objectValue));

    static field make_multiarray(std::string id, std::vector<entry_list> values,
                                 std::vector<std::string> keys, size_t category_slot,
                                 std::vector<std::string> headers = {},
                                 Json::Value meta = Json::Value(Json::objectValue));

    /**
     * Build a field from its values document ({"values": [...], "keys": [...], ...})
     * @param meta Resolved descriptor metadata (may declare keys, datatype, category_slot)
     * @param expected_records Record count of the owning dataset
     * @throws data_model_error on malformed documents or a value count mismatch
     */
    static field from_json(const std::string& id, field_type type, const Json::Value& doc,
                           const Json::Value& meta, size_t expected_records);

    /**
     * Rebuild a category field from key strings. Keys are taken from fixed_keys
     * first, then appended in order of first appearance.
     */
    static field collect_category(std::string id, const std::vector<std::string>& names,
                                  const std::vector<std::string>* fixed_keys,
                                  Json::Value meta = Json::Value(Json::objectValue));

    /**
     * Rebuild a MultiArray field from expanded tuples (category slot holding key strings)
     */
    static field collect_multiarray(std::string id, const std::vector<entry_list>& expanded,
                                    size_t category_slot, std::vector<std::string> headers,
                                    const std::vector<std::string>* fixed_keys,
                                    Json::Value meta = Json::Value(Json::objectValue));

    field_type type() const { return type_; }
    const std::string& id() const { return id_; }
    const Json::Value& meta() const { return meta_; }

    size_t size() const;

    /**
     * @throws data_model_error if the field does not hold exactly records values
     */
    void check_length(size_t records) const;

    field_value value_at(size_t index) const;
    field_value expand(size_t index) const;

    /**
     * Resolve a key name to its index. Digit strings that are valid indices
     * are used directly.
     * @throws unknown_key_error if the key is absent
     */
    size_t key_index_of(const std::string& name) const;

    // Key table of CATEGORY and MULTIARRAY fields, empty otherwise
    const std::vector<std::string>& keys() const;

    const identifier_data* as_identifier() const;
    const variable_data* as_variable() const;
    const category_data* as_category() const;
    const multiarray_data* as_multiarray() const;

    /**
     * Values document as persisted in "<id>.json"
     */
    Json::Value values_to_json() const;

private:
    using storage = std::variant<identifier_data, variable_data, category_data, multiarray_data>;

    field(std::string id, field_type type, storage data, Json::Value meta);

    std::string id_;
    field_type type_;
    storage data_;
    Json::Value meta_;
};

/**
 * JSON rendering of a field value (expanded tuples become nested arrays)
 */
Json::Value field_value_to_json(const field_value& value, bool integral = false);

#endif // BLOBSIFT_FIELD_HPP
