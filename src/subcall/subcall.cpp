/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include "utility.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Common")
        ("progress", "Report each filter, field and section as it is processed")
        ("h,help", "Show help message")
        ;
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    logging::set_progress_enabled(args.count("progress") > 0);
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    open_dataset(args["directory"].as<std::string>());
    execute(args);
}

void subcall::open_dataset(const std::filesystem::path& dir) {
    dataset = std::make_unique<blob_dir>(dir);

    const auto& meta = dataset->meta();
    logging::info("Opened dataset '" + meta.dataset_id() + "' (" +
                  std::to_string(dataset->records()) + " records, " +
                  std::to_string(meta.list_fields().size()) + " fields) from " + dir.string());
}

} // namespace subcall
