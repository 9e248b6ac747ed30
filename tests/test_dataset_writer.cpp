/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include <gtest/gtest.h>

#include "blob_dir.hpp"
#include "dataset_writer.hpp"
#include "file_io.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

TEST(dataset_writer, writes_retained_records_in_order) {
    temp_dir tmp;
    write_sample_dataset(tmp / "ds");
    blob_dir source(tmp / "ds");

    auto result = dataset_writer::write(source, tmp / "out", {0, 2, 4});
    EXPECT_TRUE(result.diag.empty());
    EXPECT_EQ(result.fields_written.size(), 7u);

    blob_dir written(tmp / "out");
    EXPECT_EQ(written.records(), 3u);
    EXPECT_EQ(written.meta().dataset_id(), "out");
    EXPECT_EQ(written.meta().origin(), "sample");

    const auto& ids = written.identifiers().as_identifier()->values;
    EXPECT_EQ(ids, (std::vector<std::string>{"c1", "c3", "c5"}));

    const auto& cov = written.fetch_field("reads_cov").as_variable()->values;
    EXPECT_EQ(cov, (std::vector<double>{10, 5, 1}));
}

TEST(dataset_writer, recomputes_ranges_and_assembly) {
    temp_dir tmp;
    write_sample_dataset(tmp / "ds");
    blob_dir source(tmp / "ds");

    dataset_writer::write(source, tmp / "out", {0, 2, 4});
    dataset_meta meta = dataset_meta::load(tmp / "out");

    Json::Value gc_range = meta.field_meta("gc")["range"];
    ASSERT_EQ(gc_range.size(), 2u);
    EXPECT_DOUBLE_EQ(gc_range[0].asDouble(), 0.3);
    EXPECT_DOUBLE_EQ(gc_range[1].asDouble(), 0.7);

    Json::Value length_range = meta.field_meta("length")["range"];
    EXPECT_TRUE(length_range[0].isIntegral());
    EXPECT_EQ(length_range[0].asInt64(), 100);
    EXPECT_EQ(length_range[1].asInt64(), 500);

    EXPECT_EQ(meta.assembly()["span"].asInt64(), 900);
    EXPECT_EQ(meta.assembly()["scaffold-count"].asUInt64(), 3u);
}

TEST(dataset_writer, prunes_category_keys) {
    temp_dir tmp;
    write_sample_dataset(tmp / "ds");
    blob_dir source(tmp / "ds");

    dataset_writer::write(source, tmp / "out", {0, 1, 3});
    Json::Value doc = file_io::read_json(tmp / "out" / "bestsumorder_phylum.json");

    ASSERT_EQ(doc["keys"].size(), 2u);
    EXPECT_EQ(doc["keys"][0].asString(), "Chordata");
    EXPECT_EQ(doc["keys"][1].asString(), "Arthropoda");
    ASSERT_EQ(doc["values"].size(), 3u);
    EXPECT_EQ(doc["values"][2].asUInt64(), 0u);
}

TEST(dataset_writer, rejects_empty_selection) {
    temp_dir tmp;
    write_sample_dataset(tmp / "ds");
    blob_dir source(tmp / "ds");

    EXPECT_THROW(dataset_writer::write(source, tmp / "out", {}), std::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(tmp / "out" / "meta.json"));
}

TEST(dataset_writer, child_keys_follow_parent) {
    temp_dir tmp;
    blob_dir_builder builder(tmp / "ds", "nested");
    builder.identifiers({"r1", "r2", "r3"})
        .category("phylum", string_array({"A", "B", "C"}));

    Json::Value child(Json::objectValue);
    child["id"] = "phylum_positions";
    child["type"] = "multiarray";
    child["category_slot"] = 0;

    auto tuple = [](const std::string& key, int pos) {
        Json::Value t(Json::arrayValue);
        t.append(key);
        t.append(pos);
        return t;
    };
    Json::Value values(Json::arrayValue);
    for (const auto& [key, pos] : std::vector<std::pair<std::string, int>>{{"A", 1}, {"C", 2}, {"B", 3}}) {
        Json::Value record(Json::arrayValue);
        record.append(tuple(key, pos));
        values.append(record);
    }
    Json::Value doc(Json::objectValue);
    doc["values"] = values;
    builder.add_nested("phylum", "data", child, &doc).write();

    blob_dir source(tmp / "ds");
    dataset_writer::write(source, tmp / "out", {1, 2});

    Json::Value parent_doc = file_io::read_json(tmp / "out" / "phylum.json");
    Json::Value child_doc = file_io::read_json(tmp / "out" / "phylum_positions.json");

    ASSERT_EQ(child_doc["keys"].size(), 2u);
    EXPECT_EQ(child_doc["keys"], parent_doc["keys"]);
    EXPECT_EQ(child_doc["keys"][0].asString(), "B");
    // record r2 holds key C, index 1 in the shared table
    EXPECT_EQ(child_doc["values"][0][0][0].asInt64(), 1);
    EXPECT_EQ(child_doc["values"][0][0][1].asInt64(), 2);
}

TEST(dataset_writer, subset_field_keeps_retained_order) {
    field f = field::make_category("cat", {0, 1, 2, 1}, {"A", "B", "C"});
    field subset = dataset_writer::subset_field(f, {3, 0});

    EXPECT_EQ(subset.keys(), (std::vector<std::string>{"B", "A"}));
    EXPECT_EQ(std::get<std::string>(subset.expand(0)), "B");
    EXPECT_EQ(std::get<std::string>(subset.expand(1)), "A");
}

TEST(dataset_writer, drops_descriptor_of_field_without_values) {
    temp_dir tmp;
    blob_dir_builder builder(tmp / "ds", "partial");
    builder.identifiers({"r1", "r2", "r3"})
        .variable("length", int_array({10, 20, 30}), "integer");

    Json::Value orphan(Json::objectValue);
    orphan["id"] = "orphan";
    orphan["type"] = "variable";
    orphan["datatype"] = "float";
    builder.meta()["fields"].append(orphan);
    builder.write();

    blob_dir source(tmp / "ds");
    ASSERT_TRUE(source.meta().has_field("orphan"));

    auto result = dataset_writer::write(source, tmp / "out", {0, 2});
    EXPECT_TRUE(result.diag.contains("Field 'orphan' has no values document"));
    EXPECT_FALSE(result.meta.has_field("orphan"));

    blob_dir written(tmp / "out");
    EXPECT_FALSE(written.meta().has_field("orphan"));
    EXPECT_TRUE(written.meta().has_field("length"));
    EXPECT_FALSE(std::filesystem::exists(tmp / "out" / "orphan.json"));
}

TEST(dataset_writer, multiarray_keeps_slot_and_headers) {
    temp_dir tmp;
    blob_dir_builder builder(tmp / "ds", "scored");
    builder.identifiers({"r1", "r2", "r3"});

    Json::Value entry(Json::objectValue);
    entry["id"] = "busco_hits";
    entry["type"] = "multiarray";
    entry["category_slot"] = 1;
    entry["headers"] = string_array({"score", "busco"});

    auto tuple = [](double score, int64_t key) {
        Json::Value t(Json::arrayValue);
        t.append(score);
        t.append(static_cast<Json::Int64>(key));
        return t;
    };
    Json::Value values(Json::arrayValue);
    Json::Value r1(Json::arrayValue);
    r1.append(tuple(1.5, 0));
    r1.append(tuple(2.5, 2));
    Json::Value r2(Json::arrayValue);
    r2.append(tuple(3.5, 1));
    Json::Value r3(Json::arrayValue);
    r3.append(tuple(4.5, 2));
    values.append(r1);
    values.append(r2);
    values.append(r3);

    Json::Value doc(Json::objectValue);
    doc["keys"] = string_array({"x", "y", "z"});
    doc["category_slot"] = 1;
    doc["headers"] = string_array({"score", "busco"});
    doc["values"] = values;
    builder.add(entry, doc).write();

    blob_dir source(tmp / "ds");
    dataset_writer::write(source, tmp / "out", {0, 2});

    Json::Value out = file_io::read_json(tmp / "out" / "busco_hits.json");
    EXPECT_EQ(out["category_slot"].asUInt64(), 1u);
    EXPECT_EQ(out["headers"], string_array({"score", "busco"}));
    // y only occurs in the dropped record
    EXPECT_EQ(out["keys"], string_array({"x", "z"}));

    ASSERT_EQ(out["values"].size(), 2u);
    ASSERT_EQ(out["values"][0].size(), 2u);
    EXPECT_DOUBLE_EQ(out["values"][0][0][0].asDouble(), 1.5);
    EXPECT_EQ(out["values"][0][0][1].asInt64(), 0);
    EXPECT_EQ(out["values"][0][1][1].asInt64(), 1);
    EXPECT_DOUBLE_EQ(out["values"][1][0][0].asDouble(), 4.5);
    EXPECT_EQ(out["values"][1][0][1].asInt64(), 1);

    blob_dir written(tmp / "out");
    const auto* arr = written.fetch_field("busco_hits").as_multiarray();
    ASSERT_NE(arr, nullptr);
    EXPECT_EQ(arr->category_slot, 1u);
    EXPECT_EQ(arr->headers, (std::vector<std::string>{"score", "busco"}));
}
