/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "companion/companion.hpp"

#include "companion/fasta.hpp"
#include "companion/fastq.hpp"
#include "companion/text.hpp"
#include "file_io.hpp"
#include "utility.hpp"

namespace companion {

bool option_set(const companion_options& options, const std::string& name) {
    if (name == "cov") return !options.cov.empty();
    if (name == "suffix") return !options.suffix.empty();
    if (name == "text-id-column") return options.text_id_column >= 1;
    // an empty delimiter selects whitespace splitting, the header flag is a switch
    if (name == "text-delimiter" || name == "text-header") return true;
    return false;
}

std::filesystem::path output_path(const std::filesystem::path& source,
                                  const companion_options& options) {
    return file_io::suffixed_path(source, options.suffix);
}

std::vector<std::unique_ptr<companion_filter>> default_filters() {
    std::vector<std::unique_ptr<companion_filter>> filters;
    filters.push_back(std::make_unique<fasta>());
    filters.push_back(std::make_unique<fastq>());
    filters.push_back(std::make_unique<text>());
    return filters;
}

std::vector<std::filesystem::path> run(
    const std::map<std::string, std::vector<std::string>>& requests,
    const identifier_set& identifiers, const companion_options& options,
    diagnostics& diag) {

    std::vector<std::filesystem::path> written;

    for (const auto& filter : default_filters()) {
        auto it = requests.find(filter->flag());
        if (it == requests.end() || it->second.empty()) continue;

        bool requirements = true;
        for (const auto& option : filter->required_options()) {
            if (!option_set(options, option)) {
                diag.warn("'--" + option + "' must be set to use option '--" +
                          filter->flag() + "'");
                requirements = false;
            }
        }
        if (!requirements) continue;

        for (const auto& source : it->second) {
            logging::info("Filtering " + filter->flag() + " file: " + source);
            written.push_back(filter->apply_filter(identifiers, source, options));
        }
    }

    return written;
}

} // namespace companion
