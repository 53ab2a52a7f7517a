/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "cluster_table.hpp"

#include <algorithm>
#include <set>

#include "utility.hpp"

namespace {
    transcript_source lookup_table(const cluster_table::table_names& tables,
                                   const std::string& name, size_t line_num) {
        auto it = tables.find(name);
        if (it == tables.end()) {
            throw oracle_error("Cluster table line " + std::to_string(line_num) +
                               ": unknown table '" + name + "'");
        }
        return it->second;
    }

    size_t parse_position(const std::string& field) {
        if (!util::is_digits(field)) return 0;
        return std::stoull(field);
    }
}

std::map<uint64_t, std::vector<const cluster_entry*>> cluster_table::by_cluster() const& {
    std::map<uint64_t, std::vector<const cluster_entry*>> groups;
    for (const auto& entry : entries_) {
        groups[entry.cluster_id].push_back(&entry);
    }
    return groups;
}

size_t cluster_table::cluster_count() const {
    std::set<uint64_t> ids;
    for (const auto& entry : entries_) {
        ids.insert(entry.cluster_id);
    }
    return ids.size();
}

cluster_table cluster_table::parse(std::istream& in, const table_names& tables) {
    cluster_table table;

    std::string line;
    size_t line_num = 0;
    std::map<std::string, size_t> columns;

    auto column = [&columns](const std::string& name) -> long {
        auto it = columns.find(name);
        return it == columns.end() ? -1 : static_cast<long>(it->second);
    };

    while (std::getline(in, line)) {
        line_num++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto fields = util::split(line, '\t');

        // Header line
        if (line[0] == '#') {
            if (columns.empty()) {
                fields[0] = fields[0].substr(1);
                for (size_t i = 0; i < fields.size(); ++i) {
                    columns[fields[i]] = i;
                }
                for (const auto& required : {"cluster", "table", "gene"}) {
                    if (!columns.contains(required)) {
                        throw oracle_error(std::string("Cluster table is missing column '") +
                                           required + "'");
                    }
                }
            }
            continue;
        }

        if (columns.empty()) {
            throw oracle_error("Cluster table has no header line");
        }

        // util::split drops a trailing empty field; pad to the header width
        fields.resize(std::max(fields.size(), columns.size()));

        cluster_entry entry;

        const std::string& cluster_field = fields[column("cluster")];
        if (!util::is_digits(cluster_field)) {
            throw oracle_error("Cluster table line " + std::to_string(line_num) +
                               ": invalid cluster id '" + cluster_field + "'");
        }
        entry.cluster_id = std::stoull(cluster_field);
        entry.source = lookup_table(tables, fields[column("table")], line_num);
        entry.transcript_id = fields[column("gene")];

        if (entry.transcript_id.empty()) {
            throw oracle_error("Cluster table line " + std::to_string(line_num) +
                               ": empty transcript identifier");
        }

        if (column("chrom") >= 0) entry.seqid = fields[column("chrom")];
        if (column("strand") >= 0 && !fields[column("strand")].empty()) {
            entry.strand = fields[column("strand")][0];
        }
        if (column("txStart") >= 0) entry.tx_start = parse_position(fields[column("txStart")]);
        if (column("txEnd") >= 0) entry.tx_end = parse_position(fields[column("txEnd")]);

        // Conflicts are written as "table:transcript," lists
        if (column("exonConflicts") >= 0) {
            for (const auto& item : util::split(fields[column("exonConflicts")], ',')) {
                if (item.empty()) continue;
                size_t sep = item.find(':');
                if (sep == std::string::npos || sep + 1 == item.size()) {
                    throw oracle_error("Cluster table line " + std::to_string(line_num) +
                                       ": malformed exon conflict '" + item + "'");
                }
                entry.exon_conflicts.emplace_back(
                    lookup_table(tables, item.substr(0, sep), line_num),
                    item.substr(sep + 1));
            }
        }

        table.add(std::move(entry));
    }

    if (columns.empty()) {
        throw oracle_error("Cluster table is empty");
    }

    return table;
}

void cluster_table::write(std::ostream& out,
                          const std::map<transcript_source, std::string>& tables) const {
    auto table_name = [&tables](transcript_source source) {
        auto it = tables.find(source);
        return it == tables.end() ? source_to_string(source) : it->second;
    };

    out << "#cluster\t"
        << "table\t"
        << "gene\t"
        << "chrom\t"
        << "txStart\t"
        << "txEnd\t"
        << "strand\t"
        << "hasExonConflicts\t"
        << "exonConflicts\n";

    for (const auto& entry : entries_) {
        out << entry.cluster_id << "\t"
            << table_name(entry.source) << "\t"
            << entry.transcript_id << "\t"
            << entry.seqid << "\t"
            << entry.tx_start << "\t"
            << entry.tx_end << "\t"
            << entry.strand << "\t"
            << (entry.has_exon_conflicts() ? "y" : "n") << "\t";
        for (const auto& conflict : entry.exon_conflicts) {
            out << table_name(conflict.source) << ":" << conflict.transcript_id << ",";
        }
        out << "\n";
    }
}
