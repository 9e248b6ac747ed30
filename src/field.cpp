/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "field.hpp"

#include <stdexcept>
#include <unordered_map>

#include "errors.hpp"
#include "file_io.hpp"
#include "utility.hpp"

namespace {

std::vector<std::string> string_array(const Json::Value& arr, const std::string& what) {
    std::vector<std::string> out;
    if (arr.isNull()) {
        return out;
    }
    if (!arr.isArray()) {
        throw data_model_error(what + " must be an array");
    }
    out.reserve(arr.size());
    for (const auto& v : arr) {
        out.push_back(v.isString() ? v.asString() : file_io::to_compact_string(v));
    }
    return out;
}

slot_value slot_from_json(const Json::Value& v) {
    if (v.isString()) {
        return v.asString();
    }
    if (v.isInt64() && (v.type() == Json::intValue || v.type() == Json::uintValue)) {
        return static_cast<int64_t>(v.asInt64());
    }
    if (v.isNumeric()) {
        return v.asDouble();
    }
    throw data_model_error("Unsupported MultiArray tuple value");
}

Json::Value slot_to_json(const slot_value& slot) {
    if (const auto* i = std::get_if<int64_t>(&slot)) {
        return Json::Value(static_cast<Json::Int64>(*i));
    }
    if (const auto* d = std::get_if<double>(&slot)) {
        return Json::Value(*d);
    }
    return Json::Value(std::get<std::string>(slot));
}

/**
 * Incrementally builds a key table, optionally seeded with fixed keys
 */
class key_collector {
public:
    explicit key_collector(const std::vector<std::string>* fixed) {
        if (fixed) {
            for (const auto& k : *fixed) {
                index_of(k);
            }
        }
    }

    size_t index_of(const std::string& key) {
        auto it = lookup.find(key);
        if (it != lookup.end()) {
            return it->second;
        }
        size_t idx = keys.size();
        keys.push_back(key);
        lookup.emplace(key, idx);
        return idx;
    }

    std::vector<std::string> keys;

private:
    std::unordered_map<std::string, size_t> lookup;
};

} // anonymous namespace

std::string field_type_name(field_type type) {
    switch (type) {
        case field_type::IDENTIFIER: return "identifier";
        case field_type::VARIABLE:   return "variable";
        case field_type::CATEGORY:   return "category";
        case field_type::MULTIARRAY: return "multiarray";
    }
    return "unknown";
}

std::optional<field_type> parse_field_type(const std::string& name) {
    if (name == "identifier") return field_type::IDENTIFIER;
    if (name == "variable")   return field_type::VARIABLE;
    if (name == "category")   return field_type::CATEGORY;
    if (name == "multiarray") return field_type::MULTIARRAY;
    return std::nullopt;
}

// ============================================================================
// construction
// ============================================================================

field::field(std::string id, field_type type, storage data, Json::Value meta)
    : id_(std::move(id)), type_(type), data_(std::move(data)), meta_(std::move(meta)) {}

field field::make_identifier(std::string id, std::vector<std::string> values, Json::Value meta) {
    return field(std::move(id), field_type::IDENTIFIER,
                 identifier_data{std::move(values)}, std::move(meta));
}

field field::make_variable(std::string id, std::vector<double> values, bool integral,
                           Json::Value meta) {
    return field(std::move(id), field_type::VARIABLE,
                 variable_data{std::move(values), integral}, std::move(meta));
}

field field::make_category(std::string id, std::vector<size_t> values,
                           std::vector<std::string> keys, Json::Value meta) {
    for (size_t v : values) {
        if (v >= keys.size()) {
            throw data_model_error("Category field '" + id + "' has key index " +
                                   std::to_string(v) + " outside its " +
                                   std::to_string(keys.size()) + " keys");
        }
    }
    return field(std::move(id), field_type::CATEGORY,
                 category_data{std::move(values), std::move(keys)}, std::move(meta));
}

field field::make_multiarray(std::string id, std::vector<entry_list> values,
                             std::vector<std::string> keys, size_t category_slot,
                             std::vector<std::string> headers, Json::Value meta) {
    for (const auto& entries : values) {
        for (const auto& tuple : entries) {
            if (category_slot >= tuple.size()) {
                throw data_model_error("MultiArray field '" + id + "' has a tuple without slot " +
                                       std::to_string(category_slot));
            }
            const auto* idx = std::get_if<int64_t>(&tuple[category_slot]);
            if (!idx || *idx < 0 || static_cast<size_t>(*idx) >= keys.size()) {
                throw data_model_error("MultiArray field '" + id +
                                       "' has an invalid key index in its category slot");
            }
        }
    }
    multiarray_data data{std::move(values), std::move(keys), category_slot, std::move(headers)};
    return field(std::move(id), field_type::MULTIARRAY, std::move(data), std::move(meta));
}

field field::from_json(const std::string& id, field_type type, const Json::Value& doc,
                       const Json::Value& meta, size_t expected_records) {
    const Json::Value& values = doc["values"];
    if (!values.isArray()) {
        throw data_model_error("Field '" + id + "' has no values array");
    }

    auto declared = [&](const char* key) -> const Json::Value& {
        return doc.isMember(key) ? doc[key] : meta[key];
    };

    std::optional<field> parsed;

    switch (type) {
        case field_type::IDENTIFIER: {
            std::vector<std::string> ids;
            ids.reserve(values.size());
            for (const auto& v : values) {
                ids.push_back(v.asString());
            }
            parsed = make_identifier(id, std::move(ids), meta);
            break;
        }
        case field_type::VARIABLE: {
            std::vector<double> nums;
            nums.reserve(values.size());
            bool integral = meta.get("datatype", "").asString() == "integer";
            bool all_int = true;
            for (const auto& v : values) {
                if (!v.isNumeric()) {
                    throw data_model_error("Variable field '" + id + "' has a non-numeric value");
                }
                if (v.type() != Json::intValue && v.type() != Json::uintValue) {
                    all_int = false;
                }
                nums.push_back(v.asDouble());
            }
            parsed = make_variable(id, std::move(nums), integral || all_int, meta);
            break;
        }
        case field_type::CATEGORY: {
            auto keys = string_array(declared("keys"), "Keys of field '" + id + "'");
            bool by_name = !values.empty() && values[0].isString();
            if (by_name) {
                std::vector<std::string> names;
                names.reserve(values.size());
                for (const auto& v : values) {
                    names.push_back(v.asString());
                }
                parsed = collect_category(id, names, keys.empty() ? nullptr : &keys, meta);
            } else {
                std::vector<size_t> idx;
                idx.reserve(values.size());
                for (const auto& v : values) {
                    if (!v.isIntegral() || v.asInt64() < 0) {
                        throw data_model_error("Category field '" + id + "' has an invalid key index");
                    }
                    idx.push_back(static_cast<size_t>(v.asUInt64()));
                }
                parsed = make_category(id, std::move(idx), std::move(keys), meta);
            }
            break;
        }
        case field_type::MULTIARRAY: {
            auto keys = string_array(declared("keys"), "Keys of field '" + id + "'");
            auto headers = string_array(declared("headers"), "Headers of field '" + id + "'");
            size_t slot = declared("category_slot").isIntegral()
                ? static_cast<size_t>(declared("category_slot").asUInt64()) : 0;

            std::vector<entry_list> lists;
            lists.reserve(values.size());
            bool slot_by_name = false;
            for (const auto& record : values) {
                if (!record.isArray()) {
                    throw data_model_error("MultiArray field '" + id + "' has a non-array value");
                }
                entry_list entries;
                for (const auto& tuple : record) {
                    entry_tuple t;
                    if (tuple.isArray()) {
                        for (const auto& item : tuple) {
                            t.push_back(slot_from_json(item));
                        }
                    } else {
                        t.push_back(slot_from_json(tuple));
                    }
                    if (slot < t.size() && std::holds_alternative<std::string>(t[slot])) {
                        slot_by_name = true;
                    }
                    entries.push_back(std::move(t));
                }
                lists.push_back(std::move(entries));
            }
            if (slot_by_name) {
                parsed = collect_multiarray(id, lists, slot, std::move(headers),
                                            keys.empty() ? nullptr : &keys, meta);
            } else {
                parsed = make_multiarray(id, std::move(lists), std::move(keys), slot,
                                         std::move(headers), meta);
            }
            break;
        }
    }

    parsed->check_length(expected_records);
    return std::move(*parsed);
}

field field::collect_category(std::string id, const std::vector<std::string>& names,
                              const std::vector<std::string>* fixed_keys, Json::Value meta) {
    key_collector collector(fixed_keys);
    std::vector<size_t> values;
    values.reserve(names.size());
    for (const auto& name : names) {
        values.push_back(collector.index_of(name));
    }
    return make_category(std::move(id), std::move(values), std::move(collector.keys),
                         std::move(meta));
}

field field::collect_multiarray(std::string id, const std::vector<entry_list>& expanded,
                                size_t category_slot, std::vector<std::string> headers,
                                const std::vector<std::string>* fixed_keys, Json::Value meta) {
    key_collector collector(fixed_keys);
    std::vector<entry_list> values;
    values.reserve(expanded.size());
    for (const auto& entries : expanded) {
        entry_list out = entries;
        for (auto& tuple : out) {
            if (category_slot >= tuple.size()) {
                throw data_model_error("MultiArray field '" + id + "' has a tuple without slot " +
                                       std::to_string(category_slot));
            }
            auto& slot = tuple[category_slot];
            std::string name;
            if (const auto* s = std::get_if<std::string>(&slot)) {
                name = *s;
            } else if (const auto* i = std::get_if<int64_t>(&slot)) {
                name = std::to_string(*i);
            } else {
                throw data_model_error("MultiArray field '" + id +
                                       "' has a non-key value in its category slot");
            }
            slot = static_cast<int64_t>(collector.index_of(name));
        }
        values.push_back(std::move(out));
    }
    return make_multiarray(std::move(id), std::move(values), std::move(collector.keys),
                           category_slot, std::move(headers), std::move(meta));
}

// ============================================================================
// accessors
// ============================================================================

size_t field::size() const {
    switch (type_) {
        case field_type::IDENTIFIER: return std::get<identifier_data>(data_).values.size();
        case field_type::VARIABLE:   return std::get<variable_data>(data_).values.size();
        case field_type::CATEGORY:   return std::get<category_data>(data_).values.size();
        case field_type::MULTIARRAY: return std::get<multiarray_data>(data_).values.size();
    }
    return 0;
}

void field::check_length(size_t records) const {
    if (size() != records) {
        throw data_model_error("Field '" + id_ + "' has " + std::to_string(size()) +
                               " values, expected " + std::to_string(records));
    }
}

field_value field::value_at(size_t index) const {
    switch (type_) {
        case field_type::IDENTIFIER: return std::get<identifier_data>(data_).values.at(index);
        case field_type::VARIABLE:   return std::get<variable_data>(data_).values.at(index);
        case field_type::CATEGORY:   return std::get<category_data>(data_).values.at(index);
        case field_type::MULTIARRAY: return std::get<multiarray_data>(data_).values.at(index);
    }
    throw data_model_error("Unknown field type for field '" + id_ + "'");
}

field_value field::expand(size_t index) const {
    switch (type_) {
        case field_type::IDENTIFIER:
        case field_type::VARIABLE:
            return value_at(index);
        case field_type::CATEGORY: {
            const auto& cat = std::get<category_data>(data_);
            return cat.keys.at(cat.values.at(index));
        }
        case field_type::MULTIARRAY: {
            const auto& arr = std::get<multiarray_data>(data_);
            entry_list entries = arr.values.at(index);
            for (auto& tuple : entries) {
                auto key_idx = static_cast<size_t>(std::get<int64_t>(tuple[arr.category_slot]));
                tuple[arr.category_slot] = arr.keys.at(key_idx);
            }
            return entries;
        }
    }
    throw data_model_error("Unknown field type for field '" + id_ + "'");
}

size_t field::key_index_of(const std::string& name) const {
    const auto& table = keys();
    if (util::is_digits(name)) {
        try {
            size_t idx = std::stoul(name);
            if (idx < table.size()) {
                return idx;
            }
        } catch (const std::out_of_range&) {
            // too large for an index, looked up by name below
        }
    }
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i] == name) {
            return i;
        }
    }
    throw unknown_key_error(id_, name);
}

const std::vector<std::string>& field::keys() const {
    static const std::vector<std::string> no_keys;
    if (const auto* cat = as_category()) {
        return cat->keys;
    }
    if (const auto* arr = as_multiarray()) {
        return arr->keys;
    }
    return no_keys;
}

const identifier_data* field::as_identifier() const {
    return type_ == field_type::IDENTIFIER ? &std::get<identifier_data>(data_) : nullptr;
}

const variable_data* field::as_variable() const {
    return type_ == field_type::VARIABLE ? &std::get<variable_data>(data_) : nullptr;
}

const category_data* field::as_category() const {
    return type_ == field_type::CATEGORY ? &std::get<category_data>(data_) : nullptr;
}

const multiarray_data* field::as_multiarray() const {
    return type_ == field_type::MULTIARRAY ? &std::get<multiarray_data>(data_) : nullptr;
}

// ============================================================================
// serialization
// ============================================================================

Json::Value field::values_to_json() const {
    Json::Value doc(Json::objectValue);
    Json::Value values(Json::arrayValue);

    switch (type_) {
        case field_type::IDENTIFIER: {
            for (const auto& v : std::get<identifier_data>(data_).values) {
                values.append(v);
            }
            break;
        }
        case field_type::VARIABLE: {
            const auto& var = std::get<variable_data>(data_);
            for (double v : var.values) {
                values.append(field_value_to_json(v, var.integral));
            }
            break;
        }
        case field_type::CATEGORY: {
            const auto& cat = std::get<category_data>(data_);
            for (size_t v : cat.values) {
                values.append(static_cast<Json::UInt64>(v));
            }
            Json::Value keys(Json::arrayValue);
            for (const auto& k : cat.keys) {
                keys.append(k);
            }
            doc["keys"] = keys;
            break;
        }
        case field_type::MULTIARRAY: {
            const auto& arr = std::get<multiarray_data>(data_);
            for (const auto& entries : arr.values) {
                values.append(field_value_to_json(entries));
            }
            Json::Value keys(Json::arrayValue);
            for (const auto& k : arr.keys) {
                keys.append(k);
            }
            doc["keys"] = keys;
            doc["category_slot"] = static_cast<Json::UInt64>(arr.category_slot);
            if (!arr.headers.empty()) {
                Json::Value headers(Json::arrayValue);
                for (const auto& h : arr.headers) {
                    headers.append(h);
                }
                doc["headers"] = headers;
            }
            break;
        }
    }

    doc["values"] = values;
    return doc;
}

Json::Value field_value_to_json(const field_value& value, bool integral) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return Json::Value(*s);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (integral) {
            return Json::Value(static_cast<Json::Int64>(*d));
        }
        return Json::Value(*d);
    }
    if (const auto* k = std::get_if<size_t>(&value)) {
        return Json::Value(static_cast<Json::UInt64>(*k));
    }
    Json::Value arr(Json::arrayValue);
    for (const auto& tuple : std::get<entry_list>(value)) {
        Json::Value t(Json::arrayValue);
        for (const auto& slot : tuple) {
            t.append(slot_to_json(slot));
        }
        arr.append(t);
    }
    return arr;
}
