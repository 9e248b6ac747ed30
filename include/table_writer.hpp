/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_TABLE_WRITER_HPP
#define BLOBSIFT_TABLE_WRITER_HPP

// standard
#include <filesystem>
#include <string>
#include <vector>

#include "blob_dir.hpp"
#include "diagnostics.hpp"
#include "field.hpp"

/**
 * One output column: the field it reads and its header label
 */
struct table_column {
    std::string field_id;
    std::string header;
};

namespace table_writer {

constexpr const char* INDEX_COLUMN = "index";
constexpr const char* PLOT_SHORTHAND = "plot";

/**
 * Expand a comma separated field list ("gc,length=len,plot") into columns.
 * The list always starts with the synthetic index and identifiers columns;
 * "plot" expands to the x, z, y and cat axes of the dataset. An entry naming
 * index or identifiers only renames that column.
 */
std::vector<table_column> parse_columns(const std::string& fields, const dataset_meta& meta);

/**
 * ',' for .csv files, tab otherwise
 */
char delimiter_for(const std::filesystem::path& path);

/**
 * Render one cell; values are expanded (category keys as strings,
 * MultiArray tuples as compact JSON)
 */
std::string render_cell(const field& f, size_t index);

/**
 * Header row followed by one row per retained record, in retained order.
 * Columns naming unknown fields or fields without values are dropped with a warning.
 */
std::vector<std::vector<std::string>> build_rows(blob_dir& dataset, const index_list& indices,
                                                 const std::vector<table_column>& columns,
                                                 diagnostics& diag);

/**
 * Write the table to path
 * @throws std::runtime_error on I/O errors
 */
diagnostics write(blob_dir& dataset, const index_list& indices,
                  const std::filesystem::path& path, const std::string& fields);

} // namespace table_writer

#endif // BLOBSIFT_TABLE_WRITER_HPP
