/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "table_writer.hpp"

#include <algorithm>
#include <cctype>

#include "file_io.hpp"
#include "utility.hpp"

namespace table_writer {

namespace {

std::string quote_csv(const std::string& cell) {
    if (cell.find_first_of(",\"\n") == std::string::npos) {
        return cell;
    }
    std::string quoted = "\"";
    for (char c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string join_row(const std::vector<std::string>& row, char delim) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) line += delim;
        line += delim == ',' ? quote_csv(row[i]) : row[i];
    }
    return line;
}

void rename_column(std::vector<table_column>& columns, const std::string& field_id,
                   const std::string& header) {
    for (auto& column : columns) {
        if (column.field_id == field_id) {
            column.header = header;
        }
    }
}

} // anonymous namespace

std::vector<table_column> parse_columns(const std::string& fields, const dataset_meta& meta) {
    std::vector<table_column> columns = {
        {INDEX_COLUMN, INDEX_COLUMN},
        {blob_dir::IDENTIFIER_FIELD, blob_dir::IDENTIFIER_FIELD}
    };

    for (const auto& entry : util::split(fields, ',')) {
        std::string token = util::trim(entry);
        if (token.empty()) continue;

        std::string field_id = token;
        std::string header = token;
        size_t eq = token.find('=');
        if (eq != std::string::npos) {
            field_id = token.substr(0, eq);
            header = token.substr(eq + 1);
        }

        if (field_id == PLOT_SHORTHAND) {
            for (const char* axis : {"x", "z", "y", "cat"}) {
                if (auto axis_field = meta.plot_axis(axis)) {
                    columns.push_back({*axis_field, *axis_field});
                }
            }
            continue;
        }

        if (field_id == INDEX_COLUMN || field_id == blob_dir::IDENTIFIER_FIELD) {
            rename_column(columns, field_id, header);
            continue;
        }

        columns.push_back({field_id, header});
    }

    return columns;
}

char delimiter_for(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".csv" ? ',' : '\t';
}

std::string render_cell(const field& f, size_t index) {
    field_value value = f.expand(index);
    switch (f.type()) {
        case field_type::IDENTIFIER:
        case field_type::CATEGORY:
            return std::get<std::string>(value);
        case field_type::VARIABLE:
            return file_io::to_compact_string(field_value_to_json(value, f.as_variable()->integral));
        case field_type::MULTIARRAY:
            return file_io::to_compact_string(field_value_to_json(value));
    }
    return "";
}

std::vector<std::vector<std::string>> build_rows(blob_dir& dataset, const index_list& indices,
                                                 const std::vector<table_column>& columns,
                                                 diagnostics& diag) {
    // resolve fields first, dropping columns that cannot be rendered
    std::vector<table_column> kept;
    std::vector<const field*> sources;
    for (const auto& column : columns) {
        if (column.field_id == INDEX_COLUMN) {
            kept.push_back(column);
            sources.push_back(nullptr);
            continue;
        }
        const field* f = dataset.try_fetch_field(column.field_id);
        if (!f) {
            diag.warn("Skipping table column '" + column.field_id +
                      "', field not present in dataset");
            continue;
        }
        kept.push_back(column);
        sources.push_back(f);
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(indices.size() + 1);

    std::vector<std::string> header;
    for (const auto& column : kept) {
        header.push_back(column.header);
    }
    rows.push_back(std::move(header));

    for (size_t i : indices) {
        std::vector<std::string> row;
        row.reserve(kept.size());
        for (const field* f : sources) {
            row.push_back(f ? render_cell(*f, i) : std::to_string(i));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

diagnostics write(blob_dir& dataset, const index_list& indices,
                  const std::filesystem::path& path, const std::string& fields) {
    diagnostics diag;
    auto columns = parse_columns(fields, dataset.meta());
    auto rows = build_rows(dataset, indices, columns, diag);

    char delim = delimiter_for(path);
    file_io::line_writer out(path, false);
    for (const auto& row : rows) {
        out.write_line(join_row(row, delim));
    }
    out.close();

    logging::info("Wrote table with " + std::to_string(rows.size() - 1) + " rows to " +
                  path.string());
    return diag;
}

} // namespace table_writer
