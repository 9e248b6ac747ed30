/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_FILE_IO_HPP
#define BLOBSIFT_FILE_IO_HPP

// standard
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

// zlib
#include <zlib.h>

// jsoncpp
#include <json/json.h>

namespace file_io {

/**
 * Check for the gzip magic bytes (0x1f 0x8b)
 */
bool is_gzipped(const std::filesystem::path& path);

/**
 * Read a whole file into memory. Gzipped files are decompressed transparently.
 * @throws std::runtime_error if the file cannot be opened or read
 */
std::string read_text(const std::filesystem::path& path);

/**
 * Parse a (possibly gzipped) JSON document
 * @throws std::runtime_error on I/O or parse errors
 */
Json::Value read_json(const std::filesystem::path& path);

/**
 * Serialize a JSON document. Compact unless pretty is set.
 * @throws std::runtime_error if the file cannot be written
 */
void write_json(const std::filesystem::path& path, const Json::Value& doc, bool pretty = false);

/**
 * Compact single line rendering of a JSON value
 */
std::string to_compact_string(const Json::Value& value);

/**
 * Locate "<stem>.json" or "<stem>.json.gz" inside a directory.
 * Returns an empty path if neither exists.
 */
std::filesystem::path find_document(const std::filesystem::path& dir, const std::string& stem);

/**
 * Line oriented reader over plain or gzipped text files
 */
class line_reader {
public:
    explicit line_reader(const std::filesystem::path& path);
    ~line_reader();

    line_reader(const line_reader&) = delete;
    line_reader& operator=(const line_reader&) = delete;

    // Read the next line without its trailing newline; false at end of file
    bool next(std::string& line);

    size_t get_current_line() const { return line_num; }

private:
    gzFile file;
    std::filesystem::path path;
    size_t line_num;
    bool eof_reached;
};

/**
 * Line oriented writer producing plain or gzipped text
 */
class line_writer {
public:
    line_writer(const std::filesystem::path& path, bool gzipped);
    ~line_writer();

    line_writer(const line_writer&) = delete;
    line_writer& operator=(const line_writer&) = delete;

    void write_line(const std::string& line);

    // Flush and close; throws if the data could not be written
    void close();

private:
    std::filesystem::path path;
    bool gzipped;
    gzFile gzfile;
    std::ofstream plain;
};

/**
 * Insert a suffix before the extension, keeping a trailing .gz:
 * assembly.fasta.gz + filtered -> assembly.filtered.fasta.gz
 */
std::filesystem::path suffixed_path(const std::filesystem::path& path, const std::string& suffix);

} // namespace file_io

#endif // BLOBSIFT_FILE_IO_HPP
