/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "alternative_genes.hpp"

std::set<std::string> alternative_genes::collect(const gene_resolver& resolver,
                                                 const transcript& denovo,
                                                 const cluster_partition& part,
                                                 const candidate_set& candidates,
                                                 const std::optional<std::string>& assigned_gene) {
    std::set<std::string> pool;
    if (candidates.conflicts_reported) {
        for (const auto* tx : candidates.transcripts) {
            pool.insert(tx->gene_id);
        }
    } else {
        pool = part.unfiltered_gene_ids();
    }

    if (assigned_gene) {
        pool.erase(*assigned_gene);
    }

    std::set<std::string> alternatives;
    for (const auto& gene_id : pool) {
        const auto& tx_ids = part.gene_to_transcripts.at(gene_id);
        if (resolver.best_overlap(denovo, tx_ids) > resolver.get_config().min_distance) {
            alternatives.insert(gene_id);
        }
    }

    return alternatives;
}

std::optional<resolution_method> alternative_genes::adjust_method(
    std::optional<resolution_method> method, const std::set<std::string>& alternatives) {

    if (alternatives.empty() && method &&
        (*method == resolution_method::RESCUED || *method == resolution_method::AMBIGUOUS_OR_FUSION)) {
        return std::nullopt;
    }
    return method;
}
