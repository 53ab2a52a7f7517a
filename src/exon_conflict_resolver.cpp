/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "exon_conflict_resolver.hpp"

#include <algorithm>
#include <iterator>

candidate_set exon_conflict_resolver::resolve(const cluster_partition& part, const transcript& denovo) {
    candidate_set candidates;

    const auto& conflicts = part.conflicts_of(denovo.id);
    if (conflicts.empty()) {
        candidates.genes = part.filtered_gene_ids();
        candidates.transcripts = part.filtered;
        return candidates;
    }

    candidates.conflicts_reported = true;

    // Group conflicting reference transcripts of this cluster by gene
    std::set<std::string> conflicting_ids;
    gene_group conflicting_by_gene;
    for (const auto& conflict : conflicts) {
        if (conflict.source == transcript_source::DENOVO) continue;

        auto it = part.transcript_to_gene.find(conflict.transcript_id);
        if (it == part.transcript_to_gene.end()) continue;

        conflicting_ids.insert(conflict.transcript_id);
        conflicting_by_gene[it->second].insert(conflict.transcript_id);
    }

    for (const auto& [gene_id, tx_ids] : part.gene_to_transcripts) {
        auto it = conflicting_by_gene.find(gene_id);
        if (it != conflicting_by_gene.end() && it->second.size() == tx_ids.size()) {
            candidates.nonoverlapping_genes.insert(gene_id);
        }
    }

    for (const auto& gene_id : part.filtered_gene_ids()) {
        if (!candidates.nonoverlapping_genes.contains(gene_id)) {
            candidates.genes.insert(gene_id);
        }
    }

    std::copy_if(part.filtered.begin(), part.filtered.end(), std::back_inserter(candidates.transcripts),
                 [&conflicting_ids](const transcript* tx) { return !conflicting_ids.contains(tx->id); });

    return candidates;
}
