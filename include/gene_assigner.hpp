/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_GENE_ASSIGNER_HPP
#define PARENTAGE_GENE_ASSIGNER_HPP

// standard
#include <cstdint>
#include <string>
#include <vector>

// class
#include "alternative_genes.hpp"
#include "assignment_record.hpp"
#include "cluster_partitioner.hpp"
#include "gene_resolver.hpp"

/**
 * Parent gene assigner - produces one assignment record per de novo transcript
 *
 * Per cluster:
 * 1. Narrow candidate genes using exon conflicts
 * 2. Resolve the parent gene
 * 3. Collect alternative genes and adjust the resolution method
 *
 * Clusters share no state, so assign() distributes them over worker threads
 * with per-worker buffers. Records are returned sorted by transcript id,
 * identical for any thread count.
 */
class gene_assigner {
public:
    struct config {
        gene_resolver::config resolver;
        uint32_t threads = 1;
    };

    explicit gene_assigner(const transcript_index& index) : gene_assigner(index, config{}) {}
    gene_assigner(const transcript_index& index, const config& cfg);

    /**
     * Assign all de novo transcripts of one cluster
     */
    std::vector<assignment_record> assign_cluster(const cluster_partition& part) const;

    /**
     * Assign all clusters
     * @return Records sorted by transcript id
     */
    std::vector<assignment_record> assign(const std::vector<cluster_partition>& partitions);

    /**
     * Assignment statistics
     */
    struct stats {
        size_t total = 0;
        size_t assigned = 0;            // Unique match, method unset
        size_t rescued = 0;
        size_t bad_annot_or_tm = 0;
        size_t ambiguous_or_fusion = 0;
        size_t unassigned = 0;          // No gene, no method (novel or insufficient overlap)
        size_t with_alternatives = 0;
    };

    const stats& get_stats() const { return stats_; }

    /**
     * Write records as TSV (TranscriptId, AssignedGeneId, AlternativeGeneIds,
     * ResolutionMethod) with NA for missing values
     * @throws std::runtime_error if the file cannot be written
     */
    static void write_results(const std::string& filepath,
                              const std::vector<assignment_record>& records);

    /**
     * Write summary statistics to file
     */
    void write_summary(const std::string& filepath) const;

private:
    config cfg_;
    gene_resolver resolver_;
    stats stats_;

    assignment_record assign_transcript(const transcript& denovo,
                                        const cluster_partition& part) const;

    void update_stats(const std::vector<assignment_record>& records);
};

#endif // PARENTAGE_GENE_ASSIGNER_HPP
