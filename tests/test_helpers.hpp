/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_TEST_HELPERS_HPP
#define BLOBSIFT_TEST_HELPERS_HPP

// standard
#include <atomic>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

#include <unistd.h>

// jsoncpp
#include <json/json.h>

#include "file_io.hpp"

namespace test_helpers {

/**
 * Scratch directory removed on destruction
 */
class temp_dir {
public:
    temp_dir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("blobsift_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline Json::Value string_array(std::initializer_list<std::string> items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& item : items) {
        arr.append(item);
    }
    return arr;
}

inline Json::Value number_array(std::initializer_list<double> items) {
    Json::Value arr(Json::arrayValue);
    for (double item : items) {
        arr.append(item);
    }
    return arr;
}

inline Json::Value int_array(std::initializer_list<long long> items) {
    Json::Value arr(Json::arrayValue);
    for (long long item : items) {
        arr.append(static_cast<Json::Int64>(item));
    }
    return arr;
}

/**
 * Writes a BlobDir: meta.json plus one values document per data field
 */
class blob_dir_builder {
public:
    explicit blob_dir_builder(std::filesystem::path dir, std::string id = "test_dataset")
        : dir_(std::move(dir)), meta_(Json::objectValue) {
        meta_["id"] = id;
        meta_["name"] = id;
        meta_["record_type"] = "contig";
        meta_["fields"] = Json::Value(Json::arrayValue);
        meta_["plot"] = Json::Value(Json::objectValue);
    }

    blob_dir_builder& identifiers(std::initializer_list<std::string> ids) {
        Json::Value entry(Json::objectValue);
        entry["id"] = "identifiers";
        entry["type"] = "identifier";
        Json::Value doc(Json::objectValue);
        doc["values"] = string_array(ids);
        records_ = ids.size();
        return add(entry, doc);
    }

    blob_dir_builder& variable(const std::string& id, const Json::Value& values,
                               const std::string& datatype = "float") {
        Json::Value entry(Json::objectValue);
        entry["id"] = id;
        entry["type"] = "variable";
        entry["datatype"] = datatype;
        entry["scale"] = "scaleLinear";
        entry["range"] = int_array({-1, 1});   // deliberately stale
        Json::Value doc(Json::objectValue);
        doc["values"] = values;
        return add(entry, doc);
    }

    blob_dir_builder& category(const std::string& id, const Json::Value& names) {
        Json::Value entry(Json::objectValue);
        entry["id"] = id;
        entry["type"] = "category";
        Json::Value doc(Json::objectValue);
        doc["values"] = names;
        return add(entry, doc);
    }

    /**
     * Field entry and values document given verbatim
     */
    blob_dir_builder& add(const Json::Value& entry, const Json::Value& doc) {
        meta_["fields"].append(entry);
        docs_.emplace_back(entry["id"].asString(), doc);
        return *this;
    }

    /**
     * Field entry nested below an existing top level entry, without values
     * for metadata-only group children
     */
    blob_dir_builder& add_nested(const std::string& parent, const std::string& link,
                                 const Json::Value& entry, const Json::Value* doc) {
        for (auto& node : meta_["fields"]) {
            if (node["id"].asString() == parent) {
                if (!node.isMember(link)) {
                    node[link] = Json::Value(Json::arrayValue);
                }
                node[link].append(entry);
            }
        }
        if (doc) {
            docs_.emplace_back(entry["id"].asString(), *doc);
        }
        return *this;
    }

    blob_dir_builder& plot(const std::string& axis, const std::string& field_id) {
        meta_["plot"][axis] = field_id;
        return *this;
    }

    blob_dir_builder& taxon(const Json::Value& taxon) {
        meta_["taxon"] = taxon;
        return *this;
    }

    blob_dir_builder& records(size_t n) {
        records_override_ = n;
        return *this;
    }

    Json::Value& meta() { return meta_; }

    std::filesystem::path write() {
        std::filesystem::create_directories(dir_);
        meta_["records"] = static_cast<Json::UInt64>(records_override_ ? records_override_ : records_);
        file_io::write_json(dir_ / "meta.json", meta_);
        for (const auto& [id, doc] : docs_) {
            file_io::write_json(dir_ / (id + ".json"), doc);
        }
        return dir_;
    }

private:
    std::filesystem::path dir_;
    Json::Value meta_;
    std::vector<std::pair<std::string, Json::Value>> docs_;
    size_t records_ = 0;
    size_t records_override_ = 0;
};

/**
 * Five contigs with length, gc, ncount, a phylum category and read coverage
 */
inline std::filesystem::path write_sample_dataset(const std::filesystem::path& dir) {
    blob_dir_builder builder(dir, "sample");
    builder.identifiers({"c1", "c2", "c3", "c4", "c5"})
        .variable("length", int_array({100, 200, 300, 400, 500}), "integer")
        .variable("gc", number_array({0.3, 0.4, 0.5, 0.6, 0.7}))
        .variable("ncount", int_array({0, 10, 0, 20, 0}), "integer")
        .category("bestsumorder_phylum",
                  string_array({"Chordata", "Arthropoda", "no-hit", "Chordata", "Chordata"}))
        .variable("reads_cov", number_array({10, 0, 5, 20, 1}))
        .variable("reads_read_cov", int_array({100, 0, 50, 200, 10}), "integer")
        .plot("x", "gc")
        .plot("y", "reads_cov")
        .plot("z", "length")
        .plot("cat", "bestsumorder_phylum");
    return builder.write();
}

inline std::string read_file(const std::filesystem::path& path) {
    return file_io::read_text(path);
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace test_helpers

#endif // BLOBSIFT_TEST_HELPERS_HPP
