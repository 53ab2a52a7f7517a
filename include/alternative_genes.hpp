/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_ALTERNATIVE_GENES_HPP
#define PARENTAGE_ALTERNATIVE_GENES_HPP

// standard
#include <optional>
#include <set>
#include <string>

// class
#include "gene_resolver.hpp"

/**
 * Collects secondary parent gene candidates (possible paralogs)
 *
 * Pool: genes of the conflict-narrowed candidate transcripts when the oracle
 * reported exon conflicts for the transcript, otherwise the genes seen only
 * in the unfiltered reference set of the cluster. The assigned gene is
 * excluded and only genes whose best overlap exceeds min_distance are kept.
 */
class alternative_genes {
public:
    static std::set<std::string> collect(const gene_resolver& resolver,
                                         const transcript& denovo,
                                         const cluster_partition& part,
                                         const candidate_set& candidates,
                                         const std::optional<std::string>& assigned_gene);

    /**
     * Disambiguation methods only hold when alternatives remain;
     * RESCUED and AMBIGUOUS_OR_FUSION are dropped otherwise
     */
    static std::optional<resolution_method> adjust_method(std::optional<resolution_method> method,
                                                          const std::set<std::string>& alternatives);
};

#endif // PARENTAGE_ALTERNATIVE_GENES_HPP
