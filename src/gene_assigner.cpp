/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "gene_assigner.hpp"
#include "exon_conflict_resolver.hpp"
#include "utility.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

// ============================================================================
// gene_assigner implementation
// ============================================================================

gene_assigner::gene_assigner(const transcript_index& index, const config& cfg)
    : cfg_(cfg), resolver_(index, cfg.resolver) {}

assignment_record gene_assigner::assign_transcript(const transcript& denovo,
                                                   const cluster_partition& part) const {
    assignment_record record;
    record.transcript_id = denovo.id;

    // Step 1: Candidate genes, narrowed by exon conflicts
    candidate_set candidates = exon_conflict_resolver::resolve(part, denovo);

    // Step 2: Parent gene
    resolution result = resolver_.resolve(denovo, part, candidates);
    record.assigned_gene_id = result.gene_id;

    // Step 3: Alternatives
    record.alternative_gene_ids = alternative_genes::collect(resolver_, denovo, part, candidates,
                                                             result.gene_id);
    record.method = alternative_genes::adjust_method(result.method, record.alternative_gene_ids);

    return record;
}

std::vector<assignment_record> gene_assigner::assign_cluster(const cluster_partition& part) const {
    std::vector<assignment_record> records;
    records.reserve(part.denovo.size());

    for (const auto* denovo : part.denovo) {
        records.push_back(assign_transcript(*denovo, part));
    }

    return records;
}

std::vector<assignment_record> gene_assigner::assign(const std::vector<cluster_partition>& partitions) {
    size_t n_threads = cfg_.threads == 0 ? std::max(1u, std::thread::hardware_concurrency())
                                         : cfg_.threads;
    n_threads = std::min(n_threads, std::max<size_t>(1, partitions.size()));

    logging::info("Assigning parent genes for " + std::to_string(partitions.size()) +
                  " cluster(s) using " + std::to_string(n_threads) + " thread(s)");

    // Worker w handles clusters w, w + n, w + 2n, ...
    std::vector<std::vector<assignment_record>> buffers(n_threads);
    std::vector<std::exception_ptr> errors(n_threads);

    auto work = [this, &partitions, &buffers, &errors, n_threads](size_t worker) {
        try {
            for (size_t i = worker; i < partitions.size(); i += n_threads) {
                auto records = assign_cluster(partitions[i]);
                buffers[worker].insert(buffers[worker].end(),
                                       std::make_move_iterator(records.begin()),
                                       std::make_move_iterator(records.end()));
                if (worker == 0 && i % 10000 == 0) {
                    logging::progress(i, "Assigning clusters");
                }
            }
        } catch (...) {
            errors[worker] = std::current_exception();
        }
    };

    if (n_threads == 1) {
        work(0);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(n_threads);
        for (size_t w = 0; w < n_threads; ++w) {
            workers.emplace_back(work, w);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    // First failure aborts the run
    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    std::vector<assignment_record> records;
    for (auto& buffer : buffers) {
        records.insert(records.end(), std::make_move_iterator(buffer.begin()),
                       std::make_move_iterator(buffer.end()));
    }
    std::sort(records.begin(), records.end(),
              [](const assignment_record& a, const assignment_record& b) {
                  return a.transcript_id < b.transcript_id;
              });
    logging::progress_done(partitions.size(), "Assigned clusters");

    update_stats(records);
    return records;
}

void gene_assigner::update_stats(const std::vector<assignment_record>& records) {
    stats_ = stats{};
    for (const auto& record : records) {
        stats_.total++;
        if (!record.alternative_gene_ids.empty()) {
            stats_.with_alternatives++;
        }

        if (!record.method) {
            if (record.assigned_gene_id) {
                stats_.assigned++;
            } else {
                stats_.unassigned++;
            }
            continue;
        }

        switch (*record.method) {
            case resolution_method::RESCUED:
                stats_.rescued++;
                break;
            case resolution_method::BAD_ANNOT_OR_TM:
                stats_.bad_annot_or_tm++;
                break;
            case resolution_method::AMBIGUOUS_OR_FUSION:
                stats_.ambiguous_or_fusion++;
                break;
        }
    }
}

// ============================================================================
// Output methods
// ============================================================================

void gene_assigner::write_results(const std::string& filepath,
                                  const std::vector<assignment_record>& records) {
    std::ofstream out(filepath);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open output file: " + filepath);
    }

    // Header
    out << "TranscriptId\t"
        << "AssignedGeneId\t"
        << "AlternativeGeneIds\t"
        << "ResolutionMethod\n";

    for (const auto& record : records) {
        out << record.transcript_id << "\t"
            << record.assigned_gene_id.value_or("NA") << "\t"
            << record.alternatives_string().value_or("NA") << "\t"
            << (record.method ? method_to_string(*record.method) : "NA") << "\n";
    }

    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + filepath);
    }
    logging::info("Wrote " + std::to_string(records.size()) + " assignment(s) to: " + filepath);
}

void gene_assigner::write_summary(const std::string& filepath) const {
    std::ofstream out(filepath);
    if (!out.is_open()) {
        logging::error("Could not open summary file: " + filepath);
        return;
    }

    out << "# Parentage Gene Assignment Summary\n\n";

    out << "## Thresholds\n";
    out << "min_distance: " << cfg_.resolver.min_distance << "\n";
    out << "tm_jaccard_distance: " << cfg_.resolver.tm_jaccard_distance << "\n";
    out << "\n";

    out << "## Assignment Statistics\n";
    out << "De novo transcripts: " << stats_.total << "\n";
    out << "Assigned (unique): " << stats_.assigned << "\n";
    out << "Rescued: " << stats_.rescued << "\n";
    out << "badAnnotOrTm: " << stats_.bad_annot_or_tm << "\n";
    out << "ambiguousOrFusion: " << stats_.ambiguous_or_fusion << "\n";
    out << "Unassigned: " << stats_.unassigned << "\n";
    out << "With alternative genes: " << stats_.with_alternatives << "\n";

    // Calculate percentages
    if (stats_.total > 0) {
        out << "\n## Outcome Distribution\n";
        auto pct = [this](size_t count) {
            return 100.0 * static_cast<double>(count) / static_cast<double>(stats_.total);
        };
        out << "Assigned (unique): " << pct(stats_.assigned) << "%\n";
        out << "Rescued: " << pct(stats_.rescued) << "%\n";
        out << "badAnnotOrTm: " << pct(stats_.bad_annot_or_tm) << "%\n";
        out << "ambiguousOrFusion: " << pct(stats_.ambiguous_or_fusion) << "%\n";
        out << "Unassigned: " << pct(stats_.unassigned) << "%\n";
    }

    out.close();
    logging::info("Wrote summary to: " + filepath);
}
