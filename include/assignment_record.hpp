/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_ASSIGNMENT_RECORD_HPP
#define PARENTAGE_ASSIGNMENT_RECORD_HPP

// standard
#include <optional>
#include <set>
#include <string>

/**
 * How an assignment was decided when more than one gene was in play
 */
enum class resolution_method {
    RESCUED,              // One gene clearly best by overlap margin
    BAD_ANNOT_OR_TM,      // Candidate genes overlap each other too much to disambiguate
    AMBIGUOUS_OR_FUSION   // No single gene clearly best (tie or insufficient margin)
};

std::string method_to_string(resolution_method method);

/**
 * Outcome of the resolution engine for one de novo transcript
 *
 * gene set, method unset: unique match
 * gene set, method RESCUED: disambiguated by margin
 * gene unset, method set: unresolvable
 * both unset: no sufficiently overlapping candidate (putative novel)
 */
struct resolution {
    std::optional<std::string> gene_id;
    std::optional<resolution_method> method;

    resolution() = default;
    resolution(std::optional<std::string> gene, std::optional<resolution_method> m)
        : gene_id(std::move(gene)), method(m) {}

    static resolution none() { return resolution(); }

    bool operator==(const resolution& other) const {
        return gene_id == other.gene_id && method == other.method;
    }
};

/**
 * Final per-transcript output record
 */
struct assignment_record {
    std::string transcript_id;
    std::optional<std::string> assigned_gene_id;
    std::set<std::string> alternative_gene_ids;   // Sorted; never contains assigned_gene_id
    std::optional<resolution_method> method;

    /**
     * Sorted, comma-joined alternative gene ids, or nullopt if there are none
     */
    std::optional<std::string> alternatives_string() const;

    bool operator==(const assignment_record& other) const {
        return transcript_id == other.transcript_id &&
               assigned_gene_id == other.assigned_gene_id &&
               alternative_gene_ids == other.alternative_gene_ids &&
               method == other.method;
    }
};

#endif // PARENTAGE_ASSIGNMENT_RECORD_HPP
