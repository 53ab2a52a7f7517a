/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_TRANSCRIPT_HPP
#define PARENTAGE_TRANSCRIPT_HPP

#include <string>
#include <vector>

#include "interval_metrics.hpp"

/**
 * Collection a transcript model was loaded from
 */
enum class transcript_source {
    DENOVO,                 // ab-initio / comparative gene predictions
    FILTERED_REFERENCE,     // transMap projections passing quality filters
    UNFILTERED_REFERENCE    // all transMap projections
};

std::string source_to_string(transcript_source source);

/**
 * Transcript model
 * Immutable after loading; owned by the transcript_index
 */
struct transcript {
    std::string id;              // Transcript identifier (genePred name)
    std::string gene_id;         // Gene identifier (genePred name2)
    std::string seqid;           // Chromosome / contig
    char strand;                 // '+', '-' or '.' when strand is ignored
    transcript_source source;

    // Genomic extent as read from input, kept for writing oracle input
    size_t tx_start;
    size_t tx_end;
    size_t cds_start;
    size_t cds_end;

    std::vector<exon_interval> exons;   // Sorted by start

    transcript()
        : strand('.'), source(transcript_source::DENOVO),
          tx_start(0), tx_end(0), cds_start(0), cds_end(0) {}

    size_t exon_count() const { return exons.size(); }

    // Total exonic bases (exons are non-overlapping in valid genePred)
    size_t exonic_length() const { return interval_metrics::total_length(exons); }

    bool is_denovo() const { return source == transcript_source::DENOVO; }
};

#endif // PARENTAGE_TRANSCRIPT_HPP
