/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_GENE_RESOLVER_HPP
#define PARENTAGE_GENE_RESOLVER_HPP

// standard
#include <set>
#include <string>
#include <vector>

// class
#include "assignment_record.hpp"
#include "exon_conflict_resolver.hpp"
#include "transcript_index.hpp"

/**
 * Gene resolution engine - decides the parent gene of a de novo transcript
 *
 * Decision sequence:
 * 1. No candidate gene: unassigned (putative novel)
 * 2. One candidate gene: assigned if its best asymmetric overlap with the
 *    de novo transcript exceeds min_distance
 * 3. Several candidate genes: resolve_multiple_genes()
 */
class gene_resolver {
public:
    /**
     * Configuration for resolution thresholds
     */
    struct config {
        double min_distance = 0.4;         // Min overlap for assignment and min score margin
        double tm_jaccard_distance = 0.25; // Gene-gene Jaccard above which genes are deemed overlapping loci
    };

    explicit gene_resolver(const transcript_index& index) : gene_resolver(index, config{}) {}
    gene_resolver(const transcript_index& index, const config& cfg) : index_(index), cfg_(cfg) {}

    /**
     * Resolve the parent gene of a de novo transcript from its candidates
     */
    resolution resolve(const transcript& denovo,
                       const cluster_partition& part,
                       const candidate_set& candidates) const;

    /**
     * Single candidate: assign if the best overlap exceeds min_distance
     * @param tx_ids All reference transcripts of the gene in the cluster
     */
    resolution resolve_single_gene(const transcript& denovo,
                                   const std::string& gene_id,
                                   const std::set<std::string>& tx_ids) const;

    /**
     * Disambiguate between several candidate genes
     *
     * 1. If all pairwise gene-gene Jaccard scores exceed tm_jaccard_distance:
     *    (none, BAD_ANNOT_OR_TM)
     * 2. Score each gene by its best asymmetric overlap with the de novo
     *    transcript
     * 3. If the best gene beats every lower-scoring gene by at least
     *    min_distance and no other gene reaches the same score:
     *    (gene, RESCUED), else (none, AMBIGUOUS_OR_FUSION)
     *
     * @param pool Candidate reference transcripts; their own exons are scored
     */
    resolution resolve_multiple_genes(const transcript& denovo,
                                      const std::vector<const transcript*>& pool) const;

    /**
     * Best asymmetric overlap of the de novo transcript with any of the given
     * reference transcripts, using unfiltered reference bodies
     * @throws missing_transcript_error if an id is absent from the unfiltered set
     */
    double best_overlap(const transcript& denovo, const std::set<std::string>& tx_ids) const;

    /**
     * Jaccard score between the merged exonic footprints of two genes
     */
    static double highest_gene_jaccard(const std::vector<const transcript*>& gene_a,
                                       const std::vector<const transcript*>& gene_b);

    const config& get_config() const { return cfg_; }

private:
    const transcript_index& index_;
    config cfg_;
};

#endif // PARENTAGE_GENE_RESOLVER_HPP
