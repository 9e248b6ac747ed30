/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_RECORD_FILTER_HPP
#define BLOBSIFT_RECORD_FILTER_HPP

// standard
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "blob_dir.hpp"
#include "field.hpp"
#include "filter_params.hpp"

/**
 * Record filtering over ordered index lists.
 *
 * Every step takes the current index list and returns a new list that is an
 * ordered subset of it; the input is never modified.
 */
namespace record_filter {

/**
 * 0..n-1 in ascending order
 */
index_list all_indices(size_t n);

/**
 * "Inv" counts as set when present with a non-empty value
 */
bool is_inverted(const field_filter& params);

/**
 * Keys a category/MultiArray keys filter retains.
 * Without Inv the listed keys are excluded (complement over all keys),
 * with Inv only the listed keys are kept. Numeric tokens are key indices.
 * @throws unknown_key_error for key names absent from the field
 */
std::unordered_set<size_t> retained_keys(const field& f, const std::string& keys_param, bool invert);

/**
 * Keep low <= value <= high (Min/Max default to -inf/+inf); with Inv keep values outside
 * @throws invalid_parameter_value if Min or Max is not a number
 */
index_list filter_variable(const field& f, const index_list& indices, const field_filter& params);

/**
 * Keep records whose key is in retained_keys(); no-op without Keys
 */
index_list filter_category(const field& f, const index_list& indices, const field_filter& params);

/**
 * Length bound (MinLength/MaxLength) followed by the keys bound (Keys); a record passes
 * the keys bound if any of its tuples carries a retained key
 * @throws invalid_parameter_value if MinLength or MaxLength is not an integer
 */
index_list filter_multiarray(const field& f, const index_list& indices, const field_filter& params);

/**
 * Apply the predicate matching the field's type
 */
index_list filter_field(const field& f, const index_list& indices, const field_filter& params);

/**
 * Members of all_records that are not in retained, in all_records order
 */
index_list invert_indices(const index_list& all_records, const index_list& retained);

/**
 * Narrow indices by every parameterised field, in dataset field order, then
 * optionally complement the result against the starting indices
 */
index_list filter_by_params(blob_dir& dataset, const index_list& indices,
                            const filter_params& params, bool invert_all);

/**
 * Keep records whose identifier is (or, inverted, is not) in the selection
 */
index_list filter_by_identifiers(const std::vector<std::string>& identifiers,
                                 const index_list& indices,
                                 const std::unordered_set<std::string>& selection,
                                 bool invert);

/**
 * Identifiers of a saved selection ({"identifiers": [...]})
 * @throws std::runtime_error if the file is unreadable or has no identifiers array
 */
std::unordered_set<std::string> read_selection_json(const std::filesystem::path& path);

/**
 * Whitespace separated identifiers; a leading '>' is removed
 */
std::unordered_set<std::string> read_identifier_list(const std::filesystem::path& path);

} // namespace record_filter

#endif // BLOBSIFT_RECORD_FILTER_HPP
