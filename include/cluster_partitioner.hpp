/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_CLUSTER_PARTITIONER_HPP
#define PARENTAGE_CLUSTER_PARTITIONER_HPP

// standard
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

// class
#include "cluster_table.hpp"
#include "transcript_index.hpp"

// gene id -> reference transcript ids (ordered for deterministic enumeration)
using gene_group = std::map<std::string, std::set<std::string>>;

/**
 * Members of one oracle cluster, split by source
 */
struct cluster_partition {
    uint64_t cluster_id = 0;

    std::vector<const transcript*> denovo;
    std::vector<const transcript*> filtered;     // Reference members in the filtered set
    std::vector<const transcript*> unfiltered;   // Reference members only in the unfiltered set

    gene_group filtered_genes;
    gene_group unfiltered_genes;

    // Both reference subsets together
    gene_group gene_to_transcripts;
    std::map<std::string, std::string> transcript_to_gene;

    // Oracle-reported exon conflicts per de novo transcript id
    std::map<std::string, std::vector<exon_conflict>> exon_conflicts;

    std::set<std::string> filtered_gene_ids() const;
    std::set<std::string> unfiltered_gene_ids() const;

    /**
     * Exon conflicts of a de novo member (empty if none were reported)
     */
    const std::vector<exon_conflict>& conflicts_of(const std::string& denovo_id) const;
};

/**
 * Splits the oracle's cluster table into per-cluster transcript subsets
 *
 * A reference member found in the filtered collection is filtered, anything
 * else must be present in the unfiltered collection. Identifiers missing from
 * the index raise missing_transcript_error. Clusters without de novo members
 * are skipped.
 */
class cluster_partitioner {
public:
    explicit cluster_partitioner(const transcript_index& index) : index_(index) {}

    std::vector<cluster_partition> partition(const cluster_table& table) const;

    cluster_partition partition_cluster(uint64_t cluster_id,
                                        const std::vector<const cluster_entry*>& entries) const;

    /**
     * Statistics of the last partition() call
     */
    struct stats {
        size_t total_clusters = 0;
        size_t clusters_with_denovo = 0;
        size_t denovo_transcripts = 0;
    };

    const stats& get_stats() const { return stats_; }

private:
    const transcript_index& index_;
    mutable stats stats_;
};

#endif // PARENTAGE_CLUSTER_PARTITIONER_HPP
