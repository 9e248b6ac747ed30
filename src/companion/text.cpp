/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "companion/text.hpp"

#include "file_io.hpp"
#include "utility.hpp"

namespace companion {

namespace {

std::vector<std::string> split_columns(const std::string& line, const std::string& delimiter) {
    if (delimiter.empty()) {
        return util::split_whitespace(line);
    }
    std::vector<std::string> columns;
    size_t start = 0;
    size_t pos;
    while ((pos = line.find(delimiter, start)) != std::string::npos) {
        columns.push_back(line.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    columns.push_back(line.substr(start));
    return columns;
}

} // anonymous namespace

std::filesystem::path text::apply_filter(const identifier_set& identifiers,
                                         const std::filesystem::path& source,
                                         const companion_options& options) const {
    bool gzipped = file_io::is_gzipped(source);
    auto out_path = output_path(source, options);

    file_io::line_reader in(source);
    file_io::line_writer out(out_path, gzipped);

    size_t column = options.text_id_column - 1;
    size_t kept = 0;
    std::string line;
    bool first = true;
    while (in.next(line)) {
        if (first && options.text_header) {
            out.write_line(line);
            first = false;
            continue;
        }
        first = false;

        auto columns = split_columns(line, options.text_delimiter);
        if (column < columns.size() && identifiers.count(util::trim(columns[column]))) {
            out.write_line(line);
            kept++;
        }
    }
    out.close();

    logging::info("Kept " + std::to_string(kept) + " lines in " + out_path.string());
    return out_path;
}

} // namespace companion
