/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include <algorithm>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "record_filter.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

namespace {

bool is_subset(const index_list& subset, const index_list& superset) {
    return std::all_of(subset.begin(), subset.end(), [&](size_t i) {
        return std::find(superset.begin(), superset.end(), i) != superset.end();
    });
}

field variable_field() {
    return field::make_variable("length", {100, 200, 300, 400, 500}, true);
}

field category_field() {
    // keys A, B, C
    return field::make_category("cat", {0, 1, 2, 1, 0}, {"A", "B", "C"});
}

entry_tuple hit(int64_t key, double score) {
    return entry_tuple{slot_value(key), slot_value(score)};
}

field multiarray_field() {
    // record 0: two tuples (A, B); record 1: one tuple (C); record 2: none
    std::vector<entry_list> values = {
        entry_list{hit(0, 1.5), hit(1, 2.5)},
        entry_list{hit(2, 3.0)},
        entry_list{}
    };
    return field::make_multiarray("hits", values, {"A", "B", "C"}, 0);
}

} // anonymous namespace

TEST(record_filter, variable_range) {
    auto f = variable_field();
    auto all = record_filter::all_indices(5);

    auto kept = record_filter::filter_variable(f, all, {{"Min", "200"}, {"Max", "400"}});
    EXPECT_EQ(kept, (index_list{1, 2, 3}));

    auto outside = record_filter::filter_variable(f, all, {{"Min", "200"}, {"Max", "400"}, {"Inv", "true"}});
    EXPECT_EQ(outside, (index_list{0, 4}));
}

TEST(record_filter, variable_identity_and_inverted_empty) {
    auto f = variable_field();
    auto all = record_filter::all_indices(5);

    EXPECT_EQ(record_filter::filter_variable(f, all, {}), all);
    EXPECT_TRUE(record_filter::filter_variable(f, all, {{"Inv", "true"}}).empty());
    // an empty Inv value does not count as set
    EXPECT_EQ(record_filter::filter_variable(f, all, {{"Inv", ""}}), all);
}

TEST(record_filter, variable_rejects_bad_numbers) {
    auto f = variable_field();
    auto all = record_filter::all_indices(5);
    EXPECT_THROW(record_filter::filter_variable(f, all, {{"Min", "abc"}}), invalid_parameter_value);
    EXPECT_THROW(record_filter::filter_variable(f, all, {{"Max", "12x"}}), invalid_parameter_value);
}

TEST(record_filter, category_keys_exclude_by_default) {
    auto f = category_field();
    auto all = record_filter::all_indices(5);

    // Keys without Inv removes the listed keys
    auto kept = record_filter::filter_category(f, all, {{"Keys", "0"}});
    EXPECT_EQ(kept, (index_list{1, 2, 3}));

    // with Inv only the listed keys remain
    auto only = record_filter::filter_category(f, all, {{"Keys", "0"}, {"Inv", "true"}});
    EXPECT_EQ(only, (index_list{0, 4}));
}

TEST(record_filter, category_keys_by_name) {
    auto f = category_field();
    auto all = record_filter::all_indices(5);

    auto kept = record_filter::filter_category(f, all, {{"Keys", "B,C"}});
    EXPECT_EQ(kept, (index_list{0, 4}));

    EXPECT_EQ(record_filter::filter_category(f, all, {{"Inv", "true"}}), all);
    EXPECT_THROW(record_filter::filter_category(f, all, {{"Keys", "D"}}), unknown_key_error);
}

TEST(record_filter, category_oversized_index_matches_nothing) {
    auto f = category_field();
    auto all = record_filter::all_indices(5);
    const std::string huge = "99999999999999999999999";

    EXPECT_EQ(record_filter::filter_category(f, all, {{"Keys", huge}}), all);
    EXPECT_TRUE(record_filter::filter_category(f, all, {{"Keys", huge}, {"Inv", "true"}}).empty());
    EXPECT_EQ(record_filter::filter_category(f, all, {{"Keys", huge + ",A"}}), (index_list{1, 2, 3}));
}

TEST(record_filter, multiarray_length_bound) {
    auto f = multiarray_field();
    auto all = record_filter::all_indices(3);

    auto min3 = record_filter::filter_multiarray(f, all, {{"MinLength", "3"}});
    EXPECT_TRUE(std::find(min3.begin(), min3.end(), 0) == min3.end());

    auto max2 = record_filter::filter_multiarray(f, all, {{"MaxLength", "2"}});
    EXPECT_EQ(max2, all);

    auto inv = record_filter::filter_multiarray(f, all, {{"MinLength", "1"}, {"Inv", "true"}});
    EXPECT_EQ(inv, (index_list{2}));

    EXPECT_THROW(record_filter::filter_multiarray(f, all, {{"MinLength", "1.5"}}),
                 invalid_parameter_value);
}

TEST(record_filter, multiarray_keys_match_any_tuple) {
    auto f = multiarray_field();
    auto all = record_filter::all_indices(3);

    // excluding A still keeps record 0 through its B tuple
    auto kept = record_filter::filter_multiarray(f, all, {{"Keys", "A"}});
    EXPECT_EQ(kept, (index_list{0, 1}));

    auto only_c = record_filter::filter_multiarray(f, all, {{"Keys", "C"}, {"Inv", "true"}});
    EXPECT_EQ(only_c, (index_list{1}));
}

TEST(record_filter, invert_indices_complements) {
    auto all = record_filter::all_indices(5);
    EXPECT_EQ(record_filter::invert_indices(all, {1, 3}), (index_list{0, 2, 4}));
}

TEST(record_filter, filter_by_params_narrows_and_inverts) {
    temp_dir tmp;
    write_sample_dataset(tmp / "ds");
    blob_dir dataset(tmp / "ds");
    auto all = record_filter::all_indices(dataset.records());

    filter_params params = {
        {"length", {{"Min", "150"}}},
        {"bestsumorder_phylum", {{"Keys", "no-hit"}}}
    };

    auto kept = record_filter::filter_by_params(dataset, all, params, false);
    EXPECT_EQ(kept, (index_list{1, 3, 4}));
    EXPECT_TRUE(is_subset(kept, all));

    auto inverted = record_filter::filter_by_params(dataset, all, params, true);
    EXPECT_EQ(inverted, (index_list{0, 2}));
}

TEST(record_filter, sequential_filters_are_monotone) {
    temp_dir tmp;
    write_sample_dataset(tmp / "ds");
    blob_dir dataset(tmp / "ds");

    index_list current = record_filter::all_indices(dataset.records());
    std::vector<std::pair<std::string, field_filter>> steps = {
        {"gc", {{"Min", "0.35"}}},
        {"reads_cov", {{"Max", "15"}}},
        {"bestsumorder_phylum", {{"Keys", "Arthropoda"}}},
        {"length", {{"Max", "100"}, {"Inv", "1"}}}
    };
    for (const auto& [field_id, params] : steps) {
        auto next = record_filter::filter_field(dataset.fetch_field(field_id), current, params);
        EXPECT_TRUE(is_subset(next, current)) << field_id;
        EXPECT_LE(next.size(), current.size());
        current = next;
    }
    EXPECT_EQ(current, (index_list{2, 4}));
}

TEST(record_filter, identifier_selection) {
    std::vector<std::string> ids = {"c1", "c2", "c3", "c4", "c5"};
    auto all = record_filter::all_indices(5);

    EXPECT_EQ(record_filter::filter_by_identifiers(ids, all, {"c2", "c5", "x"}, false),
              (index_list{1, 4}));
    EXPECT_EQ(record_filter::filter_by_identifiers(ids, {0, 1, 2}, {"c2"}, true),
              (index_list{0, 2}));
}

TEST(record_filter, reads_selection_files) {
    temp_dir tmp;
    write_file(tmp / "sel.json", "{\"identifiers\": [\"c1\", \"c3\"]}");
    write_file(tmp / "ids.txt", ">c2\nc4  c5\n");
    write_file(tmp / "bad.json", "{\"other\": []}");

    auto json_sel = record_filter::read_selection_json(tmp / "sel.json");
    EXPECT_EQ(json_sel.size(), 2u);
    EXPECT_TRUE(json_sel.count("c3"));

    auto list_sel = record_filter::read_identifier_list(tmp / "ids.txt");
    EXPECT_EQ(list_sel.size(), 3u);
    EXPECT_TRUE(list_sel.count("c2"));

    EXPECT_THROW(record_filter::read_selection_json(tmp / "bad.json"), std::runtime_error);
}
