/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "gene_resolver.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "interval_metrics.hpp"

namespace {
    std::vector<exon_interval> gene_footprint(const std::vector<const transcript*>& gene) {
        std::vector<exon_interval> exons;
        for (const auto* tx : gene) {
            exons.insert(exons.end(), tx->exons.begin(), tx->exons.end());
        }
        return interval_metrics::gap_merge(std::move(exons), 0);
    }
}

resolution gene_resolver::resolve(const transcript& denovo,
                                  const cluster_partition& part,
                                  const candidate_set& candidates) const {
    if (candidates.genes.empty()) {
        return resolution::none();
    }

    if (candidates.genes.size() == 1) {
        const std::string& gene_id = *candidates.genes.begin();
        return resolve_single_gene(denovo, gene_id, part.gene_to_transcripts.at(gene_id));
    }

    // Genes removed by exon conflicts also take their conflicting transcripts along
    return resolve_multiple_genes(denovo, candidates.narrowed() ? candidates.transcripts
                                                                : part.filtered);
}

resolution gene_resolver::resolve_single_gene(const transcript& denovo,
                                              const std::string& gene_id,
                                              const std::set<std::string>& tx_ids) const {
    if (best_overlap(denovo, tx_ids) > cfg_.min_distance) {
        return resolution(gene_id, std::nullopt);
    }
    return resolution::none();
}

resolution gene_resolver::resolve_multiple_genes(const transcript& denovo,
                                                 const std::vector<const transcript*>& pool) const {
    std::map<std::string, std::vector<const transcript*>> by_gene;
    for (const auto* tx : pool) {
        by_gene[tx->gene_id].push_back(tx);
    }

    // Candidate genes overlapping each other point at the annotation or the projection
    std::vector<double> gene_jaccards;
    for (auto a = by_gene.begin(); a != by_gene.end(); ++a) {
        for (auto b = std::next(a); b != by_gene.end(); ++b) {
            gene_jaccards.push_back(highest_gene_jaccard(a->second, b->second));
        }
    }
    if (std::all_of(gene_jaccards.begin(), gene_jaccards.end(),
                    [this](double j) { return j > cfg_.tm_jaccard_distance; })) {
        return resolution(std::nullopt, resolution_method::BAD_ANNOT_OR_TM);
    }

    // Best asymmetric overlap per gene, in gene id order
    std::vector<std::pair<std::string, double>> best_scores;
    for (const auto& [gene_id, txs] : by_gene) {
        double best = 0.0;
        for (const auto* tx : txs) {
            best = std::max(best, interval_metrics::asymmetric_overlap(denovo.exons, tx->exons));
        }
        best_scores.emplace_back(gene_id, best);
    }

    double high_score = best_scores.front().second;
    std::string high_gene = best_scores.front().first;
    for (const auto& [gene_id, score] : best_scores) {
        if (score > high_score) {
            high_score = score;
            high_gene = gene_id;
        }
    }

    bool clear_margin = std::all_of(best_scores.begin(), best_scores.end(),
        [this, high_score](const std::pair<std::string, double>& entry) {
            return entry.second == high_score || high_score - entry.second >= cfg_.min_distance;
        });
    if (!clear_margin) {
        return resolution(std::nullopt, resolution_method::AMBIGUOUS_OR_FUSION);
    }

    // Several genes sharing the top score pick different winners here
    auto ranked = best_scores;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const std::pair<std::string, double>& a, const std::pair<std::string, double>& b) {
                         return a.second < b.second;
                     });
    if (ranked.back().first != high_gene) {
        return resolution(std::nullopt, resolution_method::AMBIGUOUS_OR_FUSION);
    }

    return resolution(high_gene, resolution_method::RESCUED);
}

double gene_resolver::best_overlap(const transcript& denovo, const std::set<std::string>& tx_ids) const {
    double best = 0.0;
    for (const auto& tx_id : tx_ids) {
        const transcript& reference = index_.at(transcript_source::UNFILTERED_REFERENCE, tx_id);
        double overlap = interval_metrics::asymmetric_overlap(denovo.exons, reference.exons);
        if (overlap > best) {
            best = overlap;
        }
    }
    return best;
}

double gene_resolver::highest_gene_jaccard(const std::vector<const transcript*>& gene_a,
                                           const std::vector<const transcript*>& gene_b) {
    return interval_metrics::symmetric_overlap(gene_footprint(gene_a), gene_footprint(gene_b));
}
