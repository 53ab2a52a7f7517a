/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "interval_metrics.hpp"

#include <algorithm>

namespace interval_metrics {

std::vector<exon_interval> gap_merge(std::vector<exon_interval> intervals, size_t gap) {
    std::vector<exon_interval> merged;

    intervals.erase(std::remove_if(intervals.begin(), intervals.end(),
                        [](const exon_interval& iv) { return iv.length() == 0; }),
                    intervals.end());
    if (intervals.empty()) return merged;

    std::sort(intervals.begin(), intervals.end());

    merged.push_back(intervals.front());
    for (size_t i = 1; i < intervals.size(); ++i) {
        auto& current = merged.back();
        const auto& next = intervals[i];
        if (next.start <= current.end + gap) {
            current.end = std::max(current.end, next.end);
        } else {
            merged.push_back(next);
        }
    }

    return merged;
}

size_t total_length(const std::vector<exon_interval>& merged) {
    size_t total = 0;
    for (const auto& iv : merged) {
        total += iv.length();
    }
    return total;
}

size_t overlap_length(const std::vector<exon_interval>& merged_a,
                      const std::vector<exon_interval>& merged_b) {
    // Sweep both sorted lists
    size_t shared = 0;
    size_t i = 0;
    size_t j = 0;
    while (i < merged_a.size() && j < merged_b.size()) {
        const auto& a = merged_a[i];
        const auto& b = merged_b[j];

        size_t lo = std::max(a.start, b.start);
        size_t hi = std::min(a.end, b.end);
        if (hi > lo) {
            shared += hi - lo;
        }

        if (a.end < b.end) {
            ++i;
        } else {
            ++j;
        }
    }
    return shared;
}

double asymmetric_overlap(const std::vector<exon_interval>& a,
                          const std::vector<exon_interval>& b) {
    auto merged_a = gap_merge(a);
    auto merged_b = gap_merge(b);
    if (merged_a.empty() || merged_b.empty()) return 0.0;

    size_t shared = overlap_length(merged_a, merged_b);
    return static_cast<double>(shared) / static_cast<double>(total_length(merged_a));
}

double symmetric_overlap(const std::vector<exon_interval>& a,
                         const std::vector<exon_interval>& b) {
    auto merged_a = gap_merge(a);
    auto merged_b = gap_merge(b);
    if (merged_a.empty() || merged_b.empty()) return 0.0;

    size_t shared = overlap_length(merged_a, merged_b);
    size_t combined = total_length(merged_a) + total_length(merged_b) - shared;
    return static_cast<double>(shared) / static_cast<double>(combined);
}

} // namespace interval_metrics
