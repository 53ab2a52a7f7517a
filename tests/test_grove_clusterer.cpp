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

#include <algorithm>

#include "grove_clusterer.hpp"
#include "test_helpers.hpp"

namespace {
    const cluster_entry& entry_of(const cluster_table& table, const std::string& id) {
        auto it = std::find_if(table.entries().begin(), table.entries().end(),
                               [&id](const cluster_entry& e) { return e.transcript_id == id; });
        if (it == table.entries().end()) {
            throw std::runtime_error("no cluster entry for " + id);
        }
        return *it;
    }
}

TEST(GroveClusterer, TrimmedExonsShortenTranscriptEnds) {
    auto tx = test::make_transcript("t", "g", transcript_source::DENOVO,
                                    {{100, 200}, {300, 400}});
    auto trimmed = grove_clusterer::trimmed_exons(tx, 10);
    ASSERT_EQ(trimmed.size(), 2u);
    EXPECT_EQ(trimmed[0], exon_interval(110, 200));
    EXPECT_EQ(trimmed[1], exon_interval(300, 390));

    auto short_exon = test::make_transcript("s", "g", transcript_source::DENOVO, {{0, 15}});
    EXPECT_TRUE(grove_clusterer::trimmed_exons(short_exon, 10).empty());
    EXPECT_EQ(grove_clusterer::trimmed_exons(short_exon, 0).size(), 1u);
}

TEST(GroveClusterer, TransitiveOverlapFormsOneClusterWithConflicts) {
    transcript_index index;
    test::add_denovo(index, "d1", {{0, 100}});
    test::add_reference(index, "a1", "geneA", {{50, 200}}, false);
    test::add_reference(index, "b1", "geneB", {{150, 300}}, false);
    test::add_reference(index, "far", "geneF", {{5000, 6000}}, false);

    grove_clusterer clusterer;
    auto table = clusterer.run(index, cluster_oracle::config{});

    ASSERT_EQ(table.size(), 4u);
    EXPECT_EQ(table.cluster_count(), 2u);

    const auto& d1 = entry_of(table, "d1");
    const auto& a1 = entry_of(table, "a1");
    const auto& b1 = entry_of(table, "b1");
    EXPECT_EQ(d1.cluster_id, a1.cluster_id);
    EXPECT_EQ(b1.cluster_id, a1.cluster_id);
    EXPECT_NE(entry_of(table, "far").cluster_id, a1.cluster_id);

    EXPECT_TRUE(d1.is_denovo());
    ASSERT_EQ(d1.exon_conflicts.size(), 1u);
    EXPECT_EQ(d1.exon_conflicts[0],
              exon_conflict(transcript_source::UNFILTERED_REFERENCE, "b1"));
    EXPECT_FALSE(a1.has_exon_conflicts());
    ASSERT_EQ(b1.exon_conflicts.size(), 1u);
    EXPECT_EQ(b1.exon_conflicts[0].source, transcript_source::DENOVO);
}

TEST(GroveClusterer, SmallEndOverlapIsIgnored) {
    transcript_index index;
    test::add_denovo(index, "d1", {{0, 100}});
    test::add_reference(index, "a1", "geneA", {{95, 300}}, false);

    grove_clusterer clusterer;
    auto table = clusterer.run(index, cluster_oracle::config{});
    EXPECT_EQ(table.cluster_count(), 2u);

    cluster_oracle::config cfg;
    cfg.ignore_bases = 0;
    EXPECT_EQ(clusterer.run(index, cfg).cluster_count(), 1u);
}

TEST(GroveClusterer, InternalExonOverlapClustersBelowTolerance) {
    // Only the outer transcript ends are trimmed; 5 shared internal bases join
    transcript_index index;
    test::add_denovo(index, "d1", {{0, 100}, {200, 300}});
    test::add_reference(index, "a1", "geneA", {{150, 205}, {400, 500}}, false);

    grove_clusterer clusterer;
    auto table = clusterer.run(index, cluster_oracle::config{});
    EXPECT_EQ(table.cluster_count(), 1u);
    EXPECT_FALSE(entry_of(table, "d1").has_exon_conflicts());
}

TEST(GroveClusterer, StrandSeparatesClustersUnlessIgnored) {
    transcript_index index;
    test::add_denovo(index, "d1", {{0, 100}}, "chr1", '+');
    test::add_reference(index, "a1", "geneA", {{0, 100}}, false, "chr1", '-');

    grove_clusterer clusterer;
    EXPECT_EQ(clusterer.run(index, cluster_oracle::config{}).cluster_count(), 2u);

    cluster_oracle::config cfg;
    cfg.stranded = false;
    EXPECT_EQ(clusterer.run(index, cfg).cluster_count(), 1u);
}

TEST(GroveClusterer, ChromosomesNeverShareClusters) {
    transcript_index index;
    test::add_denovo(index, "d1", {{0, 100}}, "chr1");
    test::add_reference(index, "a1", "geneA", {{0, 100}}, false, "chr2");

    grove_clusterer clusterer;
    EXPECT_EQ(clusterer.run(index, cluster_oracle::config{}).cluster_count(), 2u);
}

TEST(ClusterOracle, CreatesByName) {
    EXPECT_EQ(cluster_oracle::create("grove")->name(), "grove");
    EXPECT_EQ(cluster_oracle::create("clusterGenes")->name(), "clusterGenes");
    EXPECT_THROW(cluster_oracle::create("bedtools"), std::runtime_error);
}
