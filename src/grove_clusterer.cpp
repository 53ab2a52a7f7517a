/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "grove_clusterer.hpp"

#include <algorithm>
#include <map>
#include <numeric>

#include "utility.hpp"

namespace {
    // Union-find over member positions
    class disjoint_sets {
    public:
        explicit disjoint_sets(size_t n) : parent(n), rank(n, 0) {
            std::iota(parent.begin(), parent.end(), 0);
        }

        size_t find(size_t x) {
            while (parent[x] != x) {
                parent[x] = parent[parent[x]];
                x = parent[x];
            }
            return x;
        }

        void unite(size_t a, size_t b) {
            a = find(a);
            b = find(b);
            if (a == b) return;
            if (rank[a] < rank[b]) std::swap(a, b);
            parent[b] = a;
            if (rank[a] == rank[b]) rank[a]++;
        }

    private:
        std::vector<size_t> parent;
        std::vector<size_t> rank;
    };

    std::string index_name(const transcript& tx, bool stranded) {
        return stranded ? tx.seqid + ":" + tx.strand : tx.seqid;
    }

    // Half-open [start, end) stored as closed grove interval [start, end - 1]
    gdt::interval to_grove(const exon_interval& exon) {
        return gdt::interval(exon.start, exon.end - 1);
    }
}

std::vector<exon_interval> grove_clusterer::trimmed_exons(const transcript& tx, size_t ignore_bases) {
    std::vector<exon_interval> exons = interval_metrics::gap_merge(tx.exons);
    if (exons.empty() || ignore_bases == 0) return exons;

    exons.front().start = std::min(exons.front().start + ignore_bases, exons.front().end);
    exons.back().end = std::max(exons.back().end > ignore_bases ? exons.back().end - ignore_bases : 0,
                                exons.back().start);

    exons.erase(std::remove_if(exons.begin(), exons.end(),
                    [](const exon_interval& e) { return e.length() == 0; }),
                exons.end());
    return exons;
}

cluster_table grove_clusterer::run(const transcript_index& index, const config& cfg) {
    // Members: unfiltered reference followed by de novo, each coordinate sorted
    std::vector<const transcript*> members = index.sorted(transcript_source::UNFILTERED_REFERENCE);
    auto denovo = index.sorted(transcript_source::DENOVO);
    members.insert(members.end(), denovo.begin(), denovo.end());

    std::stable_sort(members.begin(), members.end(), [](const transcript* a, const transcript* b) {
        if (a->seqid != b->seqid) return a->seqid < b->seqid;
        return a->tx_start < b->tx_start;
    });

    logging::info("Clustering " + std::to_string(members.size()) + " transcript(s) with genogrove");

    exon_grove grove(order_);
    std::vector<std::vector<exon_interval>> trimmed(members.size());

    for (size_t i = 0; i < members.size(); ++i) {
        trimmed[i] = trimmed_exons(*members[i], cfg.ignore_bases);
        std::string name = index_name(*members[i], cfg.stranded);
        for (size_t e = 0; e < trimmed[i].size(); ++e) {
            grove.insert_data(name, to_grove(trimmed[i][e]), exon_ref(i, e));
        }
    }

    // Join transcripts with shared (trimmed) exonic bases
    disjoint_sets sets(members.size());
    for (size_t i = 0; i < members.size(); ++i) {
        std::string name = index_name(*members[i], cfg.stranded);
        for (const auto& exon : trimmed[i]) {
            auto result = grove.intersect(to_grove(exon), name);
            for (auto* key : result.get_keys()) {
                const exon_ref& ref = key->get_data();
                if (ref.member == i) continue;

                const auto& other = trimmed[ref.member][ref.exon];
                if (std::min(exon.end, other.end) > std::max(exon.start, other.start)) {
                    sets.unite(i, ref.member);
                }
            }
        }
        if (i % 10000 == 0) {
            logging::progress(i, "Clustering transcripts");
        }
    }
    logging::progress_done(members.size(), "Clustered transcripts");

    // Cluster ids in order of first member
    std::map<size_t, std::vector<size_t>> groups;
    std::vector<size_t> root_order;
    for (size_t i = 0; i < members.size(); ++i) {
        size_t root = sets.find(i);
        auto [it, inserted] = groups.try_emplace(root);
        if (inserted) root_order.push_back(root);
        it->second.push_back(i);
    }

    std::vector<std::vector<exon_interval>> merged(members.size());
    for (size_t i = 0; i < members.size(); ++i) {
        merged[i] = interval_metrics::gap_merge(members[i]->exons);
    }

    cluster_table table;
    uint64_t cluster_id = 0;
    for (size_t root : root_order) {
        cluster_id++;
        const auto& group = groups[root];

        for (size_t i : group) {
            const transcript* tx = members[i];

            cluster_entry entry;
            entry.cluster_id = cluster_id;
            entry.transcript_id = tx->id;
            entry.source = tx->is_denovo() ? transcript_source::DENOVO
                                           : transcript_source::UNFILTERED_REFERENCE;
            entry.seqid = tx->seqid;
            entry.strand = tx->strand;
            entry.tx_start = tx->tx_start;
            entry.tx_end = tx->tx_end;

            for (size_t j : group) {
                if (j == i) continue;
                if (interval_metrics::overlap_length(merged[i], merged[j]) == 0) {
                    const transcript* other = members[j];
                    entry.exon_conflicts.emplace_back(
                        other->is_denovo() ? transcript_source::DENOVO
                                           : transcript_source::UNFILTERED_REFERENCE,
                        other->id);
                }
            }

            table.add(std::move(entry));
        }
    }

    logging::info("Found " + std::to_string(cluster_id) + " cluster(s)");
    return table;
}
