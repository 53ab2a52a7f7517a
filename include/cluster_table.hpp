/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_CLUSTER_TABLE_HPP
#define PARENTAGE_CLUSTER_TABLE_HPP

// standard
#include <cstdint>
#include <istream>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

// class
#include "transcript.hpp"

/**
 * Raised when the clustering oracle fails or produces unusable output
 */
class oracle_error : public std::runtime_error {
public:
    explicit oracle_error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Transcript named by an exon conflict ("table:transcriptId" in the oracle output)
 */
struct exon_conflict {
    transcript_source source;
    std::string transcript_id;

    exon_conflict() : source(transcript_source::UNFILTERED_REFERENCE) {}
    exon_conflict(transcript_source s, std::string id) : source(s), transcript_id(std::move(id)) {}

    bool operator==(const exon_conflict& other) const {
        return source == other.source && transcript_id == other.transcript_id;
    }
};

/**
 * One row of the oracle output: membership of a transcript in a cluster
 * Reference rows carry UNFILTERED_REFERENCE; the filtered/unfiltered split is
 * made later against the transcript_index.
 */
struct cluster_entry {
    uint64_t cluster_id;
    std::string transcript_id;
    transcript_source source;
    std::vector<exon_conflict> exon_conflicts;

    // Informational columns (written back by the cluster subcommand)
    std::string seqid;
    char strand;
    size_t tx_start;
    size_t tx_end;

    cluster_entry()
        : cluster_id(0), source(transcript_source::UNFILTERED_REFERENCE),
          strand('.'), tx_start(0), tx_end(0) {}

    bool is_denovo() const { return source == transcript_source::DENOVO; }
    bool has_exon_conflicts() const { return !exon_conflicts.empty(); }
};

/**
 * Oracle output: cluster membership for every clustered transcript
 *
 * Text layout follows clusterGenes -conflicted:
 * #cluster  table  gene  chrom  txStart  txEnd  strand  hasExonConflicts  ...  exonConflicts  ...
 */
class cluster_table {
public:
    using table_names = std::map<std::string, transcript_source>;

    cluster_table() = default;

    void add(cluster_entry entry) { entries_.push_back(std::move(entry)); }

    const std::vector<cluster_entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * Entries grouped by cluster id (ascending), in input order within a cluster.
     * The pointers refer into this table, so it must outlive the result.
     */
    std::map<uint64_t, std::vector<const cluster_entry*>> by_cluster() const&;
    std::map<uint64_t, std::vector<const cluster_entry*>> by_cluster() const&& = delete;

    /**
     * Number of distinct clusters
     */
    size_t cluster_count() const;

    /**
     * Parse oracle output
     * @param in Tab-separated table with a '#cluster' header line
     * @param tables Maps the 'table' column (and conflict prefixes) to a source
     * @throws oracle_error on missing columns, bad cluster ids or unknown tables
     */
    static cluster_table parse(std::istream& in, const table_names& tables);

    /**
     * Write the table in the layout accepted by parse()
     * @param tables Table name per source (reverse of the parse mapping)
     */
    void write(std::ostream& out, const std::map<transcript_source, std::string>& tables) const;

private:
    std::vector<cluster_entry> entries_;
};

#endif // PARENTAGE_CLUSTER_TABLE_HPP
