/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "test_helpers.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

namespace test {

transcript make_transcript(const std::string& id, const std::string& gene_id,
                           transcript_source source,
                           const std::vector<exon_interval>& exons,
                           const std::string& seqid, char strand) {
    transcript tx;
    tx.id = id;
    tx.gene_id = gene_id;
    tx.source = source;
    tx.seqid = seqid;
    tx.strand = strand;
    tx.exons = exons;
    if (!exons.empty()) {
        tx.tx_start = exons.front().start;
        tx.tx_end = exons.back().end;
        tx.cds_start = tx.tx_start;
        tx.cds_end = tx.tx_end;
    }
    return tx;
}

void add_reference(transcript_index& index, const std::string& id, const std::string& gene_id,
                   const std::vector<exon_interval>& exons, bool filtered,
                   const std::string& seqid, char strand) {
    index.add(make_transcript(id, gene_id, transcript_source::UNFILTERED_REFERENCE,
                              exons, seqid, strand));
    if (filtered) {
        index.add(make_transcript(id, gene_id, transcript_source::FILTERED_REFERENCE,
                                  exons, seqid, strand));
    }
}

void add_denovo(transcript_index& index, const std::string& id,
                const std::vector<exon_interval>& exons,
                const std::string& seqid, char strand) {
    index.add(make_transcript(id, id, transcript_source::DENOVO, exons, seqid, strand));
}

cluster_entry make_entry(uint64_t cluster_id, const std::string& transcript_id,
                         transcript_source source,
                         const std::vector<exon_conflict>& conflicts) {
    cluster_entry entry;
    entry.cluster_id = cluster_id;
    entry.transcript_id = transcript_id;
    entry.source = source;
    entry.exon_conflicts = conflicts;
    return entry;
}

cluster_partition make_partition(const transcript_index& index,
                                 const std::vector<cluster_entry>& entries) {
    std::vector<const cluster_entry*> pointers;
    for (const auto& entry : entries) {
        pointers.push_back(&entry);
    }
    cluster_partitioner partitioner(index);
    return partitioner.partition_cluster(entries.empty() ? 0 : entries.front().cluster_id,
                                         pointers);
}

temp_dir::temp_dir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "parentage_test.XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Could not create temporary directory");
    }
    path_ = buffer.data();
}

temp_dir::~temp_dir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path temp_dir::write(const std::string& name, const std::string& content) const {
    auto file = path_ / name;
    std::ofstream out(file);
    out << content;
    return file;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace test
