/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "file_io.hpp"

// standard
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace file_io {

bool is_gzipped(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    char magic[2] = {0, 0};
    file.read(magic, sizeof(magic));
    return file.gcount() == 2 &&
           static_cast<unsigned char>(magic[0]) == 0x1f &&
           static_cast<unsigned char>(magic[1]) == 0x8b;
}

std::string read_text(const std::filesystem::path& path) {
    // gzread passes plain files through unchanged
    gzFile gzfile = gzopen(path.string().c_str(), "rb");
    if (!gzfile) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    std::string content;
    char buffer[65536];
    int bytes_read;
    while ((bytes_read = gzread(gzfile, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(bytes_read));
    }

    if (bytes_read < 0) {
        int errnum = 0;
        std::string message = gzerror(gzfile, &errnum);
        gzclose(gzfile);
        throw std::runtime_error("Failed to read file: " + path.string() + " (" + message + ")");
    }

    gzclose(gzfile);
    return content;
}

Json::Value read_json(const std::filesystem::path& path) {
    std::string content = read_text(path);

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value doc;
    std::string errors;
    if (!reader->parse(content.data(), content.data() + content.size(), &doc, &errors)) {
        throw std::runtime_error("Failed to parse JSON document " + path.string() + ": " + errors);
    }
    return doc;
}

void write_json(const std::filesystem::path& path, const Json::Value& doc, bool pretty) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + path.string());
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["precision"] = 15;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(doc, &file);
    file << '\n';

    if (!file) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

std::string to_compact_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["precision"] = 15;
    return Json::writeString(builder, value);
}

std::filesystem::path find_document(const std::filesystem::path& dir, const std::string& stem) {
    auto plain = dir / (stem + ".json");
    if (std::filesystem::is_regular_file(plain)) {
        return plain;
    }
    auto gzipped = dir / (stem + ".json.gz");
    if (std::filesystem::is_regular_file(gzipped)) {
        return gzipped;
    }
    return {};
}

// ============================================================================
// line_reader
// ============================================================================

line_reader::line_reader(const std::filesystem::path& path)
    : path(path), line_num(0), eof_reached(false) {
    file = gzopen(path.string().c_str(), "rb");
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
}

line_reader::~line_reader() {
    if (file) {
        gzclose(file);
    }
}

bool line_reader::next(std::string& line) {
    line.clear();
    if (eof_reached) {
        return false;
    }

    char buffer[8192];
    bool got_data = false;
    while (gzgets(file, buffer, sizeof(buffer)) != nullptr) {
        got_data = true;
        size_t len = std::strlen(buffer);
        if (len > 0 && buffer[len - 1] == '\n') {
            line.append(buffer, len - 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            line_num++;
            return true;
        }
        line.append(buffer, len);
    }

    int errnum = 0;
    const char* message = gzerror(file, &errnum);
    if (errnum != Z_OK && errnum != Z_STREAM_END) {
        throw std::runtime_error("Error reading " + path.string() + ": " + message);
    }

    eof_reached = true;
    if (got_data) {
        // last line without trailing newline
        line_num++;
        return true;
    }
    return false;
}

// ============================================================================
// line_writer
// ============================================================================

line_writer::line_writer(const std::filesystem::path& path, bool gzipped)
    : path(path), gzipped(gzipped), gzfile(nullptr) {
    if (gzipped) {
        gzfile = gzopen(path.string().c_str(), "wb");
        if (!gzfile) {
            throw std::runtime_error("Cannot create file: " + path.string());
        }
    } else {
        plain.open(path);
        if (!plain.is_open()) {
            throw std::runtime_error("Cannot create file: " + path.string());
        }
    }
}

line_writer::~line_writer() {
    if (gzfile) {
        gzclose(gzfile);
    }
}

void line_writer::write_line(const std::string& line) {
    if (gzipped) {
        std::string out = line + "\n";
        int written = gzwrite(gzfile, out.data(), static_cast<unsigned>(out.size()));
        if (written != static_cast<int>(out.size())) {
            throw std::runtime_error("Failed to write file: " + path.string());
        }
    } else {
        plain << line << '\n';
        if (!plain) {
            throw std::runtime_error("Failed to write file: " + path.string());
        }
    }
}

void line_writer::close() {
    if (gzipped) {
        if (gzfile) {
            int status = gzclose(gzfile);
            gzfile = nullptr;
            if (status != Z_OK) {
                throw std::runtime_error("Failed to close file: " + path.string());
            }
        }
    } else if (plain.is_open()) {
        plain.close();
        if (plain.fail()) {
            throw std::runtime_error("Failed to close file: " + path.string());
        }
    }
}

std::filesystem::path suffixed_path(const std::filesystem::path& path, const std::string& suffix) {
    std::filesystem::path base = path;
    std::string gz;
    if (base.extension() == ".gz") {
        gz = ".gz";
        base = base.parent_path() / base.stem();
    }
    std::string name = base.stem().string() + "." + suffix + base.extension().string() + gz;
    return path.parent_path() / name;
}

} // namespace file_io
