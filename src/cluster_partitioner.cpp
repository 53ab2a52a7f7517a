/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "cluster_partitioner.hpp"

#include <algorithm>

#include "utility.hpp"

namespace {
    const std::vector<exon_conflict> no_conflicts;

    std::set<std::string> gene_ids(const gene_group& genes) {
        std::set<std::string> ids;
        for (const auto& [gene_id, tx_ids] : genes) {
            ids.insert(gene_id);
        }
        return ids;
    }

    void sort_by_id(std::vector<const transcript*>& transcripts) {
        std::sort(transcripts.begin(), transcripts.end(),
                  [](const transcript* a, const transcript* b) { return a->id < b->id; });
    }
}

std::set<std::string> cluster_partition::filtered_gene_ids() const {
    return gene_ids(filtered_genes);
}

std::set<std::string> cluster_partition::unfiltered_gene_ids() const {
    return gene_ids(unfiltered_genes);
}

const std::vector<exon_conflict>& cluster_partition::conflicts_of(const std::string& denovo_id) const {
    auto it = exon_conflicts.find(denovo_id);
    return it == exon_conflicts.end() ? no_conflicts : it->second;
}

cluster_partition cluster_partitioner::partition_cluster(
    uint64_t cluster_id, const std::vector<const cluster_entry*>& entries) const {

    cluster_partition part;
    part.cluster_id = cluster_id;

    std::set<std::string> seen_denovo;
    std::set<std::string> seen_reference;

    for (const auto* entry : entries) {
        if (entry->is_denovo()) {
            if (!seen_denovo.insert(entry->transcript_id).second) continue;
            part.denovo.push_back(&index_.at(transcript_source::DENOVO, entry->transcript_id));
            part.exon_conflicts[entry->transcript_id] = entry->exon_conflicts;
            continue;
        }

        if (!seen_reference.insert(entry->transcript_id).second) continue;

        if (const auto* tx = index_.find(transcript_source::FILTERED_REFERENCE, entry->transcript_id)) {
            part.filtered.push_back(tx);
            part.filtered_genes[tx->gene_id].insert(tx->id);
        } else {
            const auto& unfiltered = index_.at(transcript_source::UNFILTERED_REFERENCE,
                                               entry->transcript_id);
            part.unfiltered.push_back(&unfiltered);
            part.unfiltered_genes[unfiltered.gene_id].insert(unfiltered.id);
        }
    }

    sort_by_id(part.denovo);
    sort_by_id(part.filtered);
    sort_by_id(part.unfiltered);

    for (const auto* group : {&part.filtered, &part.unfiltered}) {
        for (const auto* tx : *group) {
            part.gene_to_transcripts[tx->gene_id].insert(tx->id);
            part.transcript_to_gene[tx->id] = tx->gene_id;
        }
    }

    return part;
}

std::vector<cluster_partition> cluster_partitioner::partition(const cluster_table& table) const {
    std::vector<cluster_partition> partitions;
    stats_ = stats{};

    for (const auto& [cluster_id, entries] : table.by_cluster()) {
        stats_.total_clusters++;

        bool has_denovo = std::any_of(entries.begin(), entries.end(),
                                      [](const cluster_entry* e) { return e->is_denovo(); });
        if (!has_denovo) continue;

        partitions.push_back(partition_cluster(cluster_id, entries));
        stats_.clusters_with_denovo++;
        stats_.denovo_transcripts += partitions.back().denovo.size();
    }

    logging::info("Partitioned " + std::to_string(stats_.total_clusters) + " cluster(s); " +
                  std::to_string(stats_.clusters_with_denovo) + " contain de novo transcripts");

    return partitions;
}
