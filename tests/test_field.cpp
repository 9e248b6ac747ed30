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

#include "errors.hpp"
#include "field.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

TEST(field, variable_from_json_checks_length) {
    Json::Value doc(Json::objectValue);
    doc["values"] = number_array({1.5, 2.5, 3.5});

    Json::Value meta(Json::objectValue);
    EXPECT_NO_THROW(field::from_json("gc", field_type::VARIABLE, doc, meta, 3));
    EXPECT_THROW(field::from_json("gc", field_type::VARIABLE, doc, meta, 4), data_model_error);
}

TEST(field, integer_values_are_integral) {
    Json::Value doc(Json::objectValue);
    doc["values"] = int_array({100, 200});

    auto f = field::from_json("length", field_type::VARIABLE, doc, Json::Value(Json::objectValue), 2);
    ASSERT_NE(f.as_variable(), nullptr);
    EXPECT_TRUE(f.as_variable()->integral);
    EXPECT_EQ(f.values_to_json()["values"][1].asInt64(), 200);
}

TEST(field, category_by_index_and_by_name) {
    Json::Value by_index(Json::objectValue);
    by_index["values"] = int_array({0, 2, 1});
    by_index["keys"] = string_array({"A", "B", "C"});

    auto indexed = field::from_json("cat", field_type::CATEGORY, by_index,
                                    Json::Value(Json::objectValue), 3);
    EXPECT_EQ(std::get<size_t>(indexed.value_at(1)), 2u);
    EXPECT_EQ(std::get<std::string>(indexed.expand(1)), "C");

    Json::Value by_name(Json::objectValue);
    by_name["values"] = string_array({"B", "A", "B"});
    auto named = field::from_json("cat", field_type::CATEGORY, by_name,
                                  Json::Value(Json::objectValue), 3);
    ASSERT_EQ(named.keys().size(), 2u);
    EXPECT_EQ(named.keys()[0], "B");
    EXPECT_EQ(std::get<size_t>(named.value_at(1)), 1u);
}

TEST(field, category_rejects_out_of_range_index) {
    Json::Value doc(Json::objectValue);
    doc["values"] = int_array({0, 3});
    doc["keys"] = string_array({"A", "B"});
    EXPECT_THROW(field::from_json("cat", field_type::CATEGORY, doc,
                                  Json::Value(Json::objectValue), 2),
                 data_model_error);
}

TEST(field, key_index_of) {
    auto f = field::make_category("cat", {0, 1, 2}, {"A", "B", "C"});
    EXPECT_EQ(f.key_index_of("B"), 1u);
    // digit strings are used as indices directly
    EXPECT_EQ(f.key_index_of("2"), 2u);
    EXPECT_THROW(f.key_index_of("D"), unknown_key_error);
    EXPECT_THROW(f.key_index_of("99999999999999999999999"), unknown_key_error);

    try {
        f.key_index_of("Z");
        FAIL() << "expected unknown_key_error";
    } catch (const unknown_key_error& e) {
        EXPECT_EQ(e.key, "Z");
    }
}

TEST(field, multiarray_expand_resolves_keys) {
    Json::Value doc(Json::objectValue);
    Json::Value values(Json::arrayValue);
    Json::Value first(Json::arrayValue);
    first.append(int_array({1, 50}));
    first.append(int_array({0, 20}));
    values.append(first);
    values.append(Json::Value(Json::arrayValue));
    doc["values"] = values;
    doc["keys"] = string_array({"x", "y"});
    doc["category_slot"] = 0;
    doc["headers"] = string_array({"name", "score"});

    auto f = field::from_json("hits", field_type::MULTIARRAY, doc, Json::Value(Json::objectValue), 2);
    const auto* arr = f.as_multiarray();
    ASSERT_NE(arr, nullptr);
    EXPECT_EQ(arr->headers.size(), 2u);
    EXPECT_EQ(arr->values[1].size(), 0u);

    auto expanded = std::get<entry_list>(f.expand(0));
    ASSERT_EQ(expanded.size(), 2u);
    EXPECT_EQ(std::get<std::string>(expanded[0][0]), "y");
    EXPECT_EQ(std::get<int64_t>(expanded[0][1]), 50);
    EXPECT_EQ(std::get<std::string>(expanded[1][0]), "x");
}

TEST(field, collect_category_keeps_fixed_keys_first) {
    std::vector<std::string> fixed = {"Z", "A"};
    auto f = field::collect_category("cat", {"A", "B", "A"}, &fixed);
    ASSERT_EQ(f.keys().size(), 3u);
    EXPECT_EQ(f.keys()[0], "Z");
    EXPECT_EQ(f.keys()[1], "A");
    EXPECT_EQ(f.keys()[2], "B");
    EXPECT_EQ(std::get<size_t>(f.value_at(0)), 1u);
    EXPECT_EQ(std::get<size_t>(f.value_at(1)), 2u);
}

TEST(field, parse_field_type_names) {
    EXPECT_EQ(parse_field_type("variable"), field_type::VARIABLE);
    EXPECT_EQ(parse_field_type("multiarray"), field_type::MULTIARRAY);
    EXPECT_FALSE(parse_field_type("array").has_value());
    EXPECT_EQ(field_type_name(field_type::CATEGORY), "category");
}
