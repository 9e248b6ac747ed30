/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "dataset_meta.hpp"

#include <stdexcept>

#include "errors.hpp"
#include "file_io.hpp"

namespace {

// keys describing the tree structure rather than the field itself
bool is_structural(const std::string& key) {
    return key == "id" || key == "children" || key == "data";
}

} // anonymous namespace

dataset_meta::dataset_meta(Json::Value document) : doc(std::move(document)) {
    if (!doc.isObject()) {
        throw data_model_error("Dataset metadata must be a JSON object");
    }
    if (!doc.isMember("fields")) {
        doc["fields"] = Json::Value(Json::arrayValue);
    }
    reindex();
}

void dataset_meta::reindex() {
    descriptors.clear();
    field_order.clear();
    index_fields(doc["fields"], "", "", {{"fields", 0}});
}

dataset_meta dataset_meta::load(const std::filesystem::path& dir) {
    if (!std::filesystem::is_directory(dir)) {
        throw std::runtime_error("Dataset directory not found: " + dir.string());
    }
    auto meta_path = file_io::find_document(dir, "meta");
    if (meta_path.empty()) {
        throw std::runtime_error("No meta.json found in dataset directory: " + dir.string());
    }
    return dataset_meta(file_io::read_json(meta_path));
}

void dataset_meta::index_fields(const Json::Value& entries, const std::string& parent,
                                const std::string& link,
                                std::vector<std::pair<std::string, Json::ArrayIndex>> path) {
    if (!entries.isArray()) {
        throw data_model_error("Field list of dataset metadata must be an array");
    }

    for (Json::ArrayIndex i = 0; i < entries.size(); ++i) {
        const Json::Value& node = entries[i];
        if (!node.isObject() || !node["id"].isString()) {
            throw data_model_error("Field entry without an id in dataset metadata");
        }

        std::string id = node["id"].asString();
        if (descriptors.count(id)) {
            throw data_model_error("Duplicate field id in dataset metadata: " + id);
        }

        path.back().second = i;

        field_descriptor desc;
        desc.id = id;
        desc.parent = parent;
        desc.link = link;
        desc.metadata_only = node.isMember("children");
        desc.path = path;

        descriptors.emplace(id, desc);
        field_order.push_back(id);

        for (const char* nested : {"children", "data"}) {
            if (node.isMember(nested)) {
                auto child_path = path;
                child_path.emplace_back(nested, 0);
                index_fields(node[nested], id, nested, child_path);
            }
        }
    }
}

const Json::Value& dataset_meta::entry(const field_descriptor& desc) const {
    const Json::Value* node = &doc;
    for (const auto& [array, pos] : desc.path) {
        node = &(*node)[array][pos];
    }
    return *node;
}

Json::Value& dataset_meta::entry(const field_descriptor& desc) {
    Json::Value* node = &doc;
    for (const auto& [array, pos] : desc.path) {
        node = &(*node)[array][pos];
    }
    return *node;
}

std::string dataset_meta::dataset_id() const {
    return doc.get("id", "").asString();
}

size_t dataset_meta::records() const {
    const Json::Value& records = doc["records"];
    if (!records.isIntegral()) {
        throw data_model_error("Dataset metadata has no record count");
    }
    return static_cast<size_t>(records.asUInt64());
}

std::string dataset_meta::origin() const {
    return doc.get("origin", "").asString();
}

bool dataset_meta::has_field(const std::string& field_id) const {
    return descriptors.count(field_id) > 0;
}

const field_descriptor& dataset_meta::descriptor(const std::string& field_id) const {
    auto it = descriptors.find(field_id);
    if (it == descriptors.end()) {
        throw std::out_of_range("Field not present in dataset: " + field_id);
    }
    return it->second;
}

Json::Value dataset_meta::own_meta(const std::string& field_id) const {
    const Json::Value& node = entry(descriptor(field_id));
    Json::Value attrs(Json::objectValue);
    for (const auto& key : node.getMemberNames()) {
        if (key == "children" || key == "data") continue;
        attrs[key] = node[key];
    }
    return attrs;
}

Json::Value dataset_meta::field_meta(const std::string& field_id) const {
    // collect the chain of ancestors, root first
    std::vector<const field_descriptor*> chain;
    for (const auto* desc = &descriptor(field_id); ; desc = &descriptor(desc->parent)) {
        chain.insert(chain.begin(), desc);
        if (desc->parent.empty()) break;
    }

    Json::Value merged(Json::objectValue);
    for (const auto* desc : chain) {
        const Json::Value& node = entry(*desc);
        for (const auto& key : node.getMemberNames()) {
            if (is_structural(key)) continue;
            merged[key] = node[key];
        }
    }
    merged["id"] = field_id;
    return merged;
}

std::optional<field_type> dataset_meta::field_type_of(const std::string& field_id) const {
    if (!has_field(field_id)) {
        return std::nullopt;
    }
    return parse_field_type(field_meta(field_id).get("type", "").asString());
}

std::string dataset_meta::parent_of(const std::string& field_id) const {
    return descriptor(field_id).parent;
}

bool dataset_meta::is_metadata_only(const std::string& field_id) const {
    return descriptor(field_id).metadata_only;
}

std::optional<std::string> dataset_meta::plot_axis(const std::string& axis) const {
    const Json::Value& plot = doc["plot"];
    if (!plot.isObject() || !plot[axis].isString() || plot[axis].asString().empty()) {
        return std::nullopt;
    }
    return plot[axis].asString();
}

void dataset_meta::set_id(const std::string& id) {
    doc["id"] = id;
}

void dataset_meta::set_records(size_t records) {
    doc["records"] = static_cast<Json::UInt64>(records);
}

void dataset_meta::set_origin(const std::string& origin) {
    doc["origin"] = origin;
}

void dataset_meta::set_assembly_value(const std::string& key, const Json::Value& value) {
    doc["assembly"][key] = value;
}

void dataset_meta::set_field_meta(const std::string& field_id, const Json::Value& attributes) {
    Json::Value& node = entry(descriptor(field_id));
    Json::Value updated(Json::objectValue);
    for (const auto& key : attributes.getMemberNames()) {
        if (key == "children" || key == "data") continue;
        updated[key] = attributes[key];
    }
    updated["id"] = field_id;
    for (const char* nested : {"children", "data"}) {
        if (node.isMember(nested)) {
            updated[nested] = node[nested];
        }
    }
    node = updated;
}

void dataset_meta::remove_field(const std::string& field_id) {
    const field_descriptor desc = descriptor(field_id);
    const Json::Value removed = entry(desc);

    Json::Value inherited(Json::objectValue);
    for (const auto& key : removed.getMemberNames()) {
        if (!is_structural(key)) {
            inherited[key] = removed[key];
        }
    }

    // owner of the array holding the entry
    Json::Value* owner = &doc;
    for (size_t i = 0; i + 1 < desc.path.size(); ++i) {
        owner = &(*owner)[desc.path[i].first][desc.path[i].second];
    }
    const auto& [array_name, position] = desc.path.back();

    Json::Value rebuilt(Json::arrayValue);
    const Json::Value& siblings = (*owner)[array_name];
    for (Json::ArrayIndex i = 0; i < siblings.size(); ++i) {
        if (i != position) {
            rebuilt.append(siblings[i]);
            continue;
        }
        for (const char* nested : {"children", "data"}) {
            for (const auto& child : removed[nested]) {
                Json::Value promoted = inherited;
                for (const auto& key : child.getMemberNames()) {
                    promoted[key] = child[key];
                }
                rebuilt.append(promoted);
            }
        }
    }
    (*owner)[array_name] = rebuilt;

    reindex();
}
