/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_INTERVAL_METRICS_HPP
#define PARENTAGE_INTERVAL_METRICS_HPP

// standard
#include <cstddef>
#include <vector>

/**
 * Half-open genomic interval [start, end) in 0-based coordinates
 */
struct exon_interval {
    size_t start;
    size_t end;

    exon_interval() : start(0), end(0) {}
    exon_interval(size_t s, size_t e) : start(s), end(e) {}

    size_t length() const { return end > start ? end - start : 0; }

    bool operator==(const exon_interval& other) const {
        return start == other.start && end == other.end;
    }

    bool operator<(const exon_interval& other) const {
        if (start != other.start) return start < other.start;
        return end < other.end;
    }
};

/**
 * Overlap scores between collections of exon intervals.
 *
 * All scores are computed on gap-merged collections, so redundant or
 * overlapping exons (e.g. the union of a gene's transcripts) count once.
 * Scores are plain ratios of base counts; two identical computations always
 * produce bit-identical results, which the resolution tie-breaks rely on.
 */
namespace interval_metrics {

    /**
     * Sort and coalesce intervals whose gap is <= gap (gap 0 merges touching
     * and overlapping intervals). Empty intervals are dropped.
     */
    std::vector<exon_interval> gap_merge(std::vector<exon_interval> intervals, size_t gap = 0);

    // Sum of lengths of a merged collection
    size_t total_length(const std::vector<exon_interval>& merged);

    /**
     * Number of bases shared by two merged, sorted collections
     */
    size_t overlap_length(const std::vector<exon_interval>& merged_a,
                          const std::vector<exon_interval>& merged_b);

    /**
     * Fraction of A covered by B: |A ∩ B| / |A|
     * @return 0 if either collection is empty
     */
    double asymmetric_overlap(const std::vector<exon_interval>& a,
                              const std::vector<exon_interval>& b);

    /**
     * Jaccard index: |A ∩ B| / |A ∪ B|
     * @return 0 if either collection is empty
     */
    double symmetric_overlap(const std::vector<exon_interval>& a,
                             const std::vector<exon_interval>& b);
}

#endif // PARENTAGE_INTERVAL_METRICS_HPP
