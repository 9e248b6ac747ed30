/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include <gtest/gtest.h>

#include "companion/companion.hpp"
#include "companion/fasta.hpp"
#include "companion/fastq.hpp"
#include "companion/text.hpp"
#include "filetype_detector.hpp"
#include "sequence_reader.hpp"
#include "test_helpers.hpp"
#include "utility.hpp"

using namespace test_helpers;

namespace {

const char* ASSEMBLY =
    ">c1 first contig\n"
    "ACGT\n"
    "ACGT\n"
    ">c2\n"
    "GGGG\n"
    ">c3 third\n"
    "TTTT\n";

const char* READS =
    "@r1/1\nACGT\n+\nIIII\n"
    "@r2/1\nCCCC\n+\nIIII\n"
    "@r3/1\nGGGG\n+\nIIII\n";

const char* ALIGNMENTS =
    "@HD\tVN:1.6\tSO:unsorted\n"
    "@SQ\tSN:c1\tLN:8\n"
    "@SQ\tSN:c2\tLN:4\n"
    "r1\t0\tc1\t1\t60\t4M\t*\t0\t0\tACGT\tIIII\n"
    "r2\t0\tc2\t1\t60\t4M\t*\t0\t0\tCCCC\tIIII\n"
    "r3\t4\t*\t0\t0\t*\t*\t0\t0\tGGGG\tIIII\n";

std::vector<fasta_entry> read_fasta(const std::filesystem::path& path) {
    std::vector<fasta_entry> entries;
    fasta_reader reader(path);
    fasta_entry entry;
    while (reader.read_next(entry)) {
        entries.push_back(entry);
    }
    return entries;
}

} // anonymous namespace

TEST(companion, output_path_inserts_suffix) {
    companion_options options;
    EXPECT_EQ(companion::output_path("/data/sample.fasta", options),
              std::filesystem::path("/data/sample.filtered.fasta"));
    EXPECT_EQ(companion::output_path("/data/sample.fasta.gz", options),
              std::filesystem::path("/data/sample.filtered.fasta.gz"));

    options.suffix = "kept";
    EXPECT_EQ(companion::output_path("reads.fq", options), std::filesystem::path("reads.kept.fq"));
}

TEST(companion, option_set) {
    companion_options options;
    EXPECT_FALSE(companion::option_set(options, "cov"));
    EXPECT_TRUE(companion::option_set(options, "text-delimiter"));
    EXPECT_TRUE(companion::option_set(options, "text-id-column"));
    options.text_id_column = 0;
    EXPECT_FALSE(companion::option_set(options, "text-id-column"));
    options.cov = "reads.bam";
    EXPECT_TRUE(companion::option_set(options, "cov"));
}

TEST(companion, detects_file_types) {
    temp_dir tmp;
    write_file(tmp / "a.fasta", ASSEMBLY);
    write_file(tmp / "r.fastq", READS);
    write_file(tmp / "a.sam", ALIGNMENTS);
    write_file(tmp / "t.txt", "x\n");

    filetype_detector detector;
    EXPECT_EQ(std::get<0>(detector.detect_filetype(tmp / "a.fasta")), filetype::FASTA);
    EXPECT_EQ(std::get<0>(detector.detect_filetype(tmp / "r.fastq")), filetype::FASTQ);
    EXPECT_EQ(std::get<0>(detector.detect_filetype(tmp / "a.sam")), filetype::SAM);
    EXPECT_EQ(std::get<0>(detector.detect_filetype(tmp / "t.txt")), filetype::UNKNOWN);
    EXPECT_THROW(detector.detect_filetype(tmp / "missing.fasta"), std::runtime_error);
}

TEST(companion, sequence_readers) {
    temp_dir tmp;
    write_file(tmp / "a.fasta", ASSEMBLY);
    write_file(tmp / "r.fastq", READS);

    auto entries = read_fasta(tmp / "a.fasta");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].seqid, "c1");
    EXPECT_EQ(entries[0].header, "c1 first contig");
    EXPECT_EQ(entries[0].seq, "ACGTACGT");
    EXPECT_EQ(entries[2].seq, "TTTT");

    fastq_reader reader(tmp / "r.fastq");
    fastq_entry read;
    ASSERT_TRUE(reader.read_next(read));
    EXPECT_EQ(read.seqid, "r1");
    EXPECT_EQ(read.qual, "IIII");

    EXPECT_EQ(strip_mate_suffix("read/2"), "read");
    EXPECT_EQ(strip_mate_suffix("read/3"), "read/3");
}

TEST(companion, fasta_keeps_retained_sequences) {
    temp_dir tmp;
    write_file(tmp / "sample.fasta", ASSEMBLY);

    companion::fasta filter;
    auto out = filter.apply_filter({"c1", "c3"}, tmp / "sample.fasta", companion_options{});
    EXPECT_EQ(out, tmp / "sample.filtered.fasta");

    auto entries = read_fasta(out);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].header, "c1 first contig");
    EXPECT_EQ(entries[0].seq, "ACGTACGT");
    EXPECT_EQ(entries[1].seqid, "c3");
}

TEST(companion, fasta_keeps_compression) {
    temp_dir tmp;
    {
        file_io::line_writer gz(tmp / "sample.fasta.gz", true);
        for (const auto& line : util::split(ASSEMBLY, '\n')) {
            if (!line.empty()) gz.write_line(line);
        }
        gz.close();
    }

    companion::fasta filter;
    auto out = filter.apply_filter({"c2"}, tmp / "sample.fasta.gz", companion_options{});
    EXPECT_EQ(out, tmp / "sample.filtered.fasta.gz");
    EXPECT_TRUE(file_io::is_gzipped(out));

    auto entries = read_fasta(out);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].seq, "GGGG");
}

TEST(companion, fasta_rejects_other_formats) {
    temp_dir tmp;
    write_file(tmp / "r.fastq", READS);
    companion::fasta filter;
    EXPECT_THROW(filter.apply_filter({"r1"}, tmp / "r.fastq", companion_options{}),
                 std::runtime_error);
}

TEST(companion, text_filters_by_id_column) {
    temp_dir tmp;
    write_file(tmp / "coverage.tsv", "sample\tcontig\tcov\ns1\tc1\t10\ns1\tc2\t5\ns1\t c3 \t1\n");

    companion_options options;
    options.text_delimiter = "\t";
    options.text_header = true;
    options.text_id_column = 2;

    companion::text filter;
    auto out = filter.apply_filter({"c1", "c3"}, tmp / "coverage.tsv", options);
    EXPECT_EQ(out, tmp / "coverage.filtered.tsv");
    EXPECT_EQ(read_file(out), "sample\tcontig\tcov\ns1\tc1\t10\ns1\t c3 \t1\n");
}

TEST(companion, text_splits_on_whitespace_by_default) {
    temp_dir tmp;
    write_file(tmp / "ids.txt", "c1 a\nc2   b\nc3\n");

    companion::text filter;
    auto out = filter.apply_filter({"c2"}, tmp / "ids.txt", companion_options{});
    EXPECT_EQ(read_file(out), "c2   b\n");
}

TEST(companion, fastq_keeps_reads_aligned_to_retained_sequences) {
    temp_dir tmp;
    write_file(tmp / "reads.fastq", READS);
    write_file(tmp / "aln.sam", ALIGNMENTS);

    auto aligned = companion::fastq::aligned_reads(tmp / "aln.sam", {"c1", "c3"});
    EXPECT_EQ(aligned.size(), 1u);
    EXPECT_TRUE(aligned.count("r1"));

    companion_options options;
    options.cov = (tmp / "aln.sam").string();
    companion::fastq filter;
    auto out = filter.apply_filter({"c1", "c2"}, tmp / "reads.fastq", options);
    EXPECT_EQ(read_file(out), "@r1/1\nACGT\n+\nIIII\n@r2/1\nCCCC\n+\nIIII\n");
}

TEST(companion, run_skips_filters_missing_options) {
    temp_dir tmp;
    write_file(tmp / "reads.fastq", READS);
    write_file(tmp / "sample.fasta", ASSEMBLY);

    std::map<std::string, std::vector<std::string>> requests = {
        {"fastq", {(tmp / "reads.fastq").string()}},
        {"fasta", {(tmp / "sample.fasta").string()}}
    };
    diagnostics diag;
    auto written = companion::run(requests, {"c1"}, companion_options{}, diag);

    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0], tmp / "sample.filtered.fasta");
    EXPECT_TRUE(diag.contains("'--cov' must be set to use option '--fastq'"));
    EXPECT_FALSE(std::filesystem::exists(tmp / "reads.filtered.fastq"));
}
