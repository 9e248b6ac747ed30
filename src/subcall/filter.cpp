/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/filter.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>

#include "dataset_writer.hpp"
#include "file_io.hpp"
#include "filter_params.hpp"
#include "record_filter.hpp"
#include "summary.hpp"
#include "table_writer.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options filter::parse_args(int argc, char** argv) {
    cxxopts::Options options("blobsift filter",
        "Filter a BlobDir dataset and summarise the selection");

    options.add_options("Input/Output")
        ("directory", "BlobDir dataset directory",
            cxxopts::value<std::string>())
        ("o,output", "Directory for the filtered BlobDir",
            cxxopts::value<std::string>())
        ;

    options.add_options("Selection")
        ("p,param", "Field parameter (<field>--<Param>=<value>), repeatable",
            cxxopts::value<std::vector<std::string>>())
        ("query-string", "URL query string holding field parameters",
            cxxopts::value<std::string>())
        ("json", "JSON selection file with an identifiers array",
            cxxopts::value<std::string>())
        ("list", "Whitespace separated list of identifiers",
            cxxopts::value<std::string>())
        ("invert", "Invert the selection")
        ;

    options.add_options("Companion files")
        ("fasta", "FASTA file to filter",
            cxxopts::value<std::string>())
        ("fastq", "FASTQ file to filter (requires --cov), repeatable",
            cxxopts::value<std::vector<std::string>>())
        ("cov", "SAM/BAM/CRAM file mapping reads to sequences",
            cxxopts::value<std::string>())
        ("text", "Delimited text file to filter",
            cxxopts::value<std::string>())
        ("text-delimiter", "Column delimiter of --text (default: whitespace)",
            cxxopts::value<std::string>()->default_value(""))
        ("text-id-column", "1-based column of --text holding the identifiers",
            cxxopts::value<size_t>()->default_value("1"))
        ("text-header", "First line of --text is a header")
        ("suffix", "Suffix inserted into filtered companion file names",
            cxxopts::value<std::string>()->default_value("filtered"))
        ;

    options.add_options("Tables and summaries")
        ("table", "Write a table of the selection (.csv comma, otherwise tab separated)",
            cxxopts::value<std::string>())
        ("table-fields", "Comma separated fields of --table (field=alias, plot)",
            cxxopts::value<std::string>()->default_value("plot"))
        ("summary", "Write a JSON summary of the selection",
            cxxopts::value<std::string>())
        ("summary-rank", "Taxonomic rank of the summary",
            cxxopts::value<std::string>()->default_value("phylum"))
        ("taxrule", "Classification rule of the hits summary",
            cxxopts::value<std::string>())
        ;

    add_common_options(options);

    options.parse_positional({"directory"});
    options.positional_help("DIRECTORY");

    return options;
}

void filter::validate(const cxxopts::ParseResult& args) {
    if (!args.count("directory")) {
        throw std::runtime_error("Must provide a dataset DIRECTORY");
    }

    std::string directory = args["directory"].as<std::string>();
    if (!std::filesystem::is_directory(directory)) {
        throw std::runtime_error("Dataset directory not found: " + directory);
    }

    for (const char* option : {"json", "list", "fasta", "cov", "text"}) {
        if (args.count(option)) {
            std::string file = args[option].as<std::string>();
            if (!std::filesystem::exists(file)) {
                throw std::runtime_error("File for --" + std::string(option) + " not found: " + file);
            }
        }
    }
    if (args.count("fastq")) {
        for (const auto& file : args["fastq"].as<std::vector<std::string>>()) {
            if (!std::filesystem::exists(file)) {
                throw std::runtime_error("File for --fastq not found: " + file);
            }
        }
    }
}

summary_options filter::make_summary_options(const cxxopts::ParseResult& args) {
    summary_options options;
    options.rank = args["summary-rank"].as<std::string>();
    if (args.count("taxrule")) {
        options.taxrule = args["taxrule"].as<std::string>();
    }
    return options;
}

companion_options filter::make_companion_options(const cxxopts::ParseResult& args) {
    companion_options options;
    options.suffix = args["suffix"].as<std::string>();
    if (args.count("cov")) {
        options.cov = args["cov"].as<std::string>();
    }
    options.text_delimiter = args["text-delimiter"].as<std::string>();
    options.text_header = args.count("text-header") > 0;
    options.text_id_column = args["text-id-column"].as<size_t>();
    return options;
}

void filter::execute(const cxxopts::ParseResult& args) {
    index_list indices = select_records(args);
    logging::info("Retained " + std::to_string(indices.size()) + " of " +
                  std::to_string(dataset->records()) + " records");

    if (args.count("output")) {
        write_dataset(args, indices);
    }
    filter_companions(args, indices);
    if (args.count("table")) {
        write_table(args, indices);
    }
    if (args.count("summary")) {
        write_summary(args, indices);
    }

    logging::info("Filtering complete");
}

index_list filter::select_records(const cxxopts::ParseResult& args) {
    std::vector<std::string> param_strings;
    if (args.count("param")) {
        param_strings = args["param"].as<std::vector<std::string>>();
    }
    std::string query_string;
    if (args.count("query-string")) {
        query_string = args["query-string"].as<std::string>();
    }

    auto parsed = parse_filter_params(param_strings, query_string, dataset->meta());
    parsed.diag.report();

    bool invert = args.count("invert") > 0;
    index_list indices = record_filter::all_indices(dataset->records());

    if (!parsed.params.empty()) {
        indices = record_filter::filter_by_params(*dataset, indices, parsed.params, invert);
    }

    const auto& identifiers = dataset->identifiers().as_identifier()->values;
    if (args.count("json")) {
        auto selection = record_filter::read_selection_json(args["json"].as<std::string>());
        indices = record_filter::filter_by_identifiers(identifiers, indices, selection, invert);
    }
    if (args.count("list")) {
        auto selection = record_filter::read_identifier_list(args["list"].as<std::string>());
        indices = record_filter::filter_by_identifiers(identifiers, indices, selection, invert);
    }

    return indices;
}

void filter::write_dataset(const cxxopts::ParseResult& args, const index_list& indices) {
    std::filesystem::path outdir = args["output"].as<std::string>();
    if (indices.empty()) {
        logging::warning("No records retained, not writing dataset to " + outdir.string());
        return;
    }

    logging::info("Writing filtered dataset to: " + outdir.string());
    auto result = dataset_writer::write(*dataset, outdir, indices);
    result.diag.report();
    logging::info("Wrote " + std::to_string(result.fields_written.size()) + " fields");
}

void filter::filter_companions(const cxxopts::ParseResult& args, const index_list& indices) {
    std::map<std::string, std::vector<std::string>> requests;
    if (args.count("fasta")) {
        requests["fasta"] = {args["fasta"].as<std::string>()};
    }
    if (args.count("fastq")) {
        requests["fastq"] = args["fastq"].as<std::vector<std::string>>();
    }
    if (args.count("text")) {
        requests["text"] = {args["text"].as<std::string>()};
    }
    if (requests.empty()) return;

    const auto& identifiers = dataset->identifiers().as_identifier()->values;
    identifier_set ids;
    for (size_t i : indices) {
        ids.insert(identifiers[i]);
    }

    diagnostics diag;
    companion::run(requests, ids, make_companion_options(args), diag);
    diag.report();
}

void filter::write_table(const cxxopts::ParseResult& args, const index_list& indices) {
    std::string path = args["table"].as<std::string>();
    auto diag = table_writer::write(*dataset, indices, path, args["table-fields"].as<std::string>());
    diag.report();
}

void filter::write_summary(const cxxopts::ParseResult& args, const index_list& indices) {
    std::string path = args["summary"].as<std::string>();
    auto result = summary::summarise(*dataset, indices, make_summary_options(args));
    result.diag.report();
    file_io::write_json(path, result.doc, true);
    logging::info("Wrote summary to " + path);
}

} // namespace subcall
