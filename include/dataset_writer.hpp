/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_DATASET_WRITER_HPP
#define BLOBSIFT_DATASET_WRITER_HPP

// standard
#include <filesystem>
#include <string>
#include <vector>

#include "blob_dir.hpp"
#include "dataset_meta.hpp"
#include "diagnostics.hpp"
#include "field.hpp"

namespace dataset_writer {

struct write_result {
    dataset_meta meta;                       // metadata written to the new meta.json
    std::vector<std::string> fields_written;
    diagnostics diag;
};

/**
 * Subset one field to the retained indices, in retained order.
 * Category and MultiArray key tables are rebuilt from the retained values,
 * starting from fixed_keys when given.
 */
field subset_field(const field& source, const index_list& indices,
                   const std::vector<std::string>* fixed_keys = nullptr);

/**
 * Write a new, independent BlobDir holding only the retained records.
 *
 * Every data field of the source is subset and written as "<id>.json";
 * variable ranges are recomputed, the "length" field updates the assembly
 * span and scaffold count, and meta.json is written last. Nothing is rolled
 * back if a write fails part way.
 *
 * @throws std::invalid_argument if indices is empty
 * @throws std::runtime_error on I/O errors
 */
write_result write(blob_dir& source, const std::filesystem::path& outdir,
                   const index_list& indices);

} // namespace dataset_writer

#endif // BLOBSIFT_DATASET_WRITER_HPP
