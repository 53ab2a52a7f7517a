/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include <gtest/gtest.h>

#include <zlib.h>

#include "genepred_reader.hpp"
#include "test_helpers.hpp"

namespace {
    const std::string TWO_TRANSCRIPTS =
        "# comment\n"
        "tx1\tchr1\t+\t100\t500\t150\t450\t2\t100,300,\t200,500,\t0\tgeneA\tcmpl\tcmpl\t0,1,\n"
        "\n"
        "tx2\tchr2\t-\t1000\t2000\t1000\t1000\t1\t1000,\t2000,\t0\tgeneB\tnone\tnone\t-1,\n";
}

TEST(GenePredReader, ReadsExtendedGenePred) {
    test::temp_dir dir;
    auto path = dir.write("ref.gp", TWO_TRANSCRIPTS);

    auto transcripts = genepred_reader::read_all(path, transcript_source::FILTERED_REFERENCE);
    ASSERT_EQ(transcripts.size(), 2u);

    const auto& tx1 = transcripts[0];
    EXPECT_EQ(tx1.id, "tx1");
    EXPECT_EQ(tx1.gene_id, "geneA");
    EXPECT_EQ(tx1.seqid, "chr1");
    EXPECT_EQ(tx1.strand, '+');
    EXPECT_EQ(tx1.source, transcript_source::FILTERED_REFERENCE);
    EXPECT_EQ(tx1.tx_start, 100u);
    EXPECT_EQ(tx1.tx_end, 500u);
    EXPECT_EQ(tx1.cds_start, 150u);
    EXPECT_EQ(tx1.cds_end, 450u);
    ASSERT_EQ(tx1.exon_count(), 2u);
    EXPECT_EQ(tx1.exons[0], exon_interval(100, 200));
    EXPECT_EQ(tx1.exons[1], exon_interval(300, 500));
    EXPECT_EQ(tx1.exonic_length(), 300u);

    EXPECT_EQ(transcripts[1].strand, '-');
    EXPECT_EQ(transcripts[1].gene_id, "geneB");
}

TEST(GenePredReader, IgnoreStrandStoresDot) {
    test::temp_dir dir;
    auto path = dir.write("ref.gp", TWO_TRANSCRIPTS);

    auto transcripts = genepred_reader::read_all(path, transcript_source::DENOVO, false);
    ASSERT_EQ(transcripts.size(), 2u);
    EXPECT_EQ(transcripts[0].strand, '.');
    EXPECT_EQ(transcripts[1].strand, '.');
}

TEST(GenePredReader, ReadsGzippedInput) {
    test::temp_dir dir;
    auto path = dir.path() / "ref.gp.gz";

    gzFile out = gzopen(path.string().c_str(), "wb");
    ASSERT_NE(out, nullptr);
    gzputs(out, TWO_TRANSCRIPTS.c_str());
    gzclose(out);

    auto transcripts = genepred_reader::read_all(path, transcript_source::UNFILTERED_REFERENCE);
    ASSERT_EQ(transcripts.size(), 2u);
    EXPECT_EQ(transcripts[1].id, "tx2");
}

TEST(GenePredReader, SortsExonsByStart) {
    test::temp_dir dir;
    auto path = dir.write("ref.gp",
        "tx1\tchr1\t+\t100\t500\t100\t500\t2\t300,100,\t500,200,\t0\tgeneA\n");

    auto transcripts = genepred_reader::read_all(path, transcript_source::DENOVO);
    ASSERT_EQ(transcripts.size(), 1u);
    EXPECT_EQ(transcripts[0].exons.front(), exon_interval(100, 200));
}

TEST(GenePredReader, TooFewColumnsReportsLine) {
    test::temp_dir dir;
    auto path = dir.write("bad.gp",
        "tx1\tchr1\t+\t100\t500\t100\t500\t1\t100,\t500,\t0\tgeneA\n"
        "tx2\tchr1\t+\t100\t500\n");

    try {
        genepred_reader::read_all(path, transcript_source::DENOVO);
        FAIL() << "expected parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("bad.gp:2"), std::string::npos) << e.what();
    }
}

TEST(GenePredReader, RejectsMalformedFields) {
    test::temp_dir dir;
    auto bad_strand = dir.write("strand.gp",
        "tx1\tchr1\t*\t100\t500\t100\t500\t1\t100,\t500,\t0\tgeneA\n");
    auto bad_count = dir.write("count.gp",
        "tx1\tchr1\t+\t100\t500\t100\t500\t2\t100,\t500,\t0\tgeneA\n");
    auto bad_coord = dir.write("coord.gp",
        "tx1\tchr1\t+\t1x0\t500\t100\t500\t1\t100,\t500,\t0\tgeneA\n");

    auto non_ascii = dir.write("latin1.gp",
        "tx1\tchr1\t+\t1\xB9" "0\t500\t100\t500\t1\t100,\t500,\t0\tgeneA\n");

    EXPECT_THROW(genepred_reader::read_all(non_ascii, transcript_source::DENOVO), std::runtime_error);
    EXPECT_THROW(genepred_reader::read_all(bad_strand, transcript_source::DENOVO), std::runtime_error);
    EXPECT_THROW(genepred_reader::read_all(bad_count, transcript_source::DENOVO), std::runtime_error);
    EXPECT_THROW(genepred_reader::read_all(bad_coord, transcript_source::DENOVO), std::runtime_error);
}

TEST(GenePredReader, MissingFileThrows) {
    EXPECT_THROW(genepred_reader("/nonexistent/parentage.gp", transcript_source::DENOVO),
                 std::runtime_error);
}
