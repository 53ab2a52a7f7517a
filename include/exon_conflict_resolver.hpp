/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_EXON_CONFLICT_RESOLVER_HPP
#define PARENTAGE_EXON_CONFLICT_RESOLVER_HPP

// standard
#include <set>
#include <string>
#include <vector>

// class
#include "cluster_partitioner.hpp"

/**
 * Reference genes and transcripts a de novo transcript is scored against
 */
struct candidate_set {
    std::set<std::string> genes;
    std::vector<const transcript*> transcripts;     // Filtered reference transcripts

    // Genes that only clustered with the de novo transcript through a third
    // transcript (every one of their transcripts is in exon conflict)
    std::set<std::string> nonoverlapping_genes;

    // Oracle reported a non-empty conflict list for this de novo transcript
    bool conflicts_reported = false;

    bool narrowed() const { return !nonoverlapping_genes.empty(); }
};

/**
 * Removes readthrough artifacts from a de novo transcript's candidate genes
 *
 * Clusters are transitive, so a readthrough transcript can pull two
 * neighbouring genes into one cluster although the de novo transcript shares
 * exons with only one of them. A gene is dropped only when all of its
 * transcripts in the cluster are reported as exon conflicts; a partially
 * conflicting gene stays a candidate. Conflicts naming de novo transcripts
 * never remove a gene.
 */
class exon_conflict_resolver {
public:
    /**
     * @param part Cluster containing the de novo transcript
     * @param denovo De novo member of part
     * @return All filtered genes/transcripts if no conflicts were reported,
     *         otherwise the narrowed candidates
     */
    static candidate_set resolve(const cluster_partition& part, const transcript& denovo);
};

#endif // PARENTAGE_EXON_CONFLICT_RESOLVER_HPP
