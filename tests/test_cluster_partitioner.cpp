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

#include "cluster_partitioner.hpp"
#include "test_helpers.hpp"

class ClusterPartitionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::add_reference(index, "a1", "geneA", {{0, 100}});
        test::add_reference(index, "a2", "geneA", {{0, 80}}, false);
        test::add_reference(index, "b1", "geneB", {{50, 150}}, false);
        test::add_denovo(index, "d1", {{0, 100}});
        test::add_denovo(index, "d2", {{10, 90}});
    }

    transcript_index index;
};

TEST_F(ClusterPartitionerTest, SplitsReferenceIntoFilteredAndUnfilteredOnly) {
    auto part = test::make_partition(index, {
        test::make_entry(1, "b1", transcript_source::UNFILTERED_REFERENCE),
        test::make_entry(1, "a2", transcript_source::UNFILTERED_REFERENCE),
        test::make_entry(1, "a1", transcript_source::UNFILTERED_REFERENCE),
        test::make_entry(1, "d2", transcript_source::DENOVO),
        test::make_entry(1, "d1", transcript_source::DENOVO,
                         {{transcript_source::UNFILTERED_REFERENCE, "b1"}}),
    });

    EXPECT_EQ(part.cluster_id, 1u);
    ASSERT_EQ(part.denovo.size(), 2u);
    EXPECT_EQ(part.denovo[0]->id, "d1");

    ASSERT_EQ(part.filtered.size(), 1u);
    EXPECT_EQ(part.filtered[0]->id, "a1");
    EXPECT_EQ(part.filtered[0]->source, transcript_source::FILTERED_REFERENCE);

    ASSERT_EQ(part.unfiltered.size(), 2u);
    EXPECT_EQ(part.unfiltered[0]->id, "a2");
    EXPECT_EQ(part.unfiltered[1]->id, "b1");

    EXPECT_EQ(part.filtered_gene_ids(), (std::set<std::string>{"geneA"}));
    EXPECT_EQ(part.unfiltered_gene_ids(), (std::set<std::string>{"geneA", "geneB"}));
    EXPECT_EQ(part.gene_to_transcripts.at("geneA"), (std::set<std::string>{"a1", "a2"}));
    EXPECT_EQ(part.transcript_to_gene.at("b1"), "geneB");

    EXPECT_EQ(part.conflicts_of("d1").size(), 1u);
    EXPECT_TRUE(part.conflicts_of("d2").empty());
    EXPECT_TRUE(part.conflicts_of("unknown").empty());
}

TEST_F(ClusterPartitionerTest, DuplicateEntriesAreCountedOnce) {
    auto part = test::make_partition(index, {
        test::make_entry(1, "a1", transcript_source::UNFILTERED_REFERENCE),
        test::make_entry(1, "a1", transcript_source::UNFILTERED_REFERENCE),
        test::make_entry(1, "d1", transcript_source::DENOVO),
        test::make_entry(1, "d1", transcript_source::DENOVO),
    });

    EXPECT_EQ(part.filtered.size(), 1u);
    EXPECT_EQ(part.denovo.size(), 1u);
}

TEST_F(ClusterPartitionerTest, UnknownTranscriptThrows) {
    EXPECT_THROW(test::make_partition(index, {
        test::make_entry(1, "ghost", transcript_source::UNFILTERED_REFERENCE),
        test::make_entry(1, "d1", transcript_source::DENOVO),
    }), missing_transcript_error);

    EXPECT_THROW(test::make_partition(index, {
        test::make_entry(1, "a1", transcript_source::UNFILTERED_REFERENCE),
        test::make_entry(1, "ghost", transcript_source::DENOVO),
    }), missing_transcript_error);
}

TEST_F(ClusterPartitionerTest, SkipsClustersWithoutDenovo) {
    cluster_table table;
    table.add(test::make_entry(1, "a1", transcript_source::UNFILTERED_REFERENCE));
    table.add(test::make_entry(2, "b1", transcript_source::UNFILTERED_REFERENCE));
    table.add(test::make_entry(2, "d1", transcript_source::DENOVO));
    table.add(test::make_entry(3, "d2", transcript_source::DENOVO));

    cluster_partitioner partitioner(index);
    auto partitions = partitioner.partition(table);

    ASSERT_EQ(partitions.size(), 2u);
    EXPECT_EQ(partitions[0].cluster_id, 2u);
    EXPECT_EQ(partitions[1].cluster_id, 3u);
    EXPECT_TRUE(partitions[1].filtered.empty());

    EXPECT_EQ(partitioner.get_stats().total_clusters, 3u);
    EXPECT_EQ(partitioner.get_stats().clusters_with_denovo, 2u);
    EXPECT_EQ(partitioner.get_stats().denovo_transcripts, 2u);
}
