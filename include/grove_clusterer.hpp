/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_GROVE_CLUSTERER_HPP
#define PARENTAGE_GROVE_CLUSTERER_HPP

// standard
#include <string>
#include <vector>

// genogrove
#include <genogrove/structure/grove/grove.hpp>
#include <genogrove/data_type/interval.hpp>

// class
#include "cluster_oracle.hpp"

namespace gdt = genogrove::data_type;
namespace gst = genogrove::structure;

/**
 * Exon stored in the grove, pointing back at its transcript
 */
struct exon_ref {
    size_t member;   // Position in the clusterer's member list
    size_t exon;     // Exon number within the transcript

    exon_ref() : member(0), exon(0) {}
    exon_ref(size_t m, size_t e) : member(m), exon(e) {}
};

using exon_grove = gst::grove<gdt::interval, exon_ref>;

/**
 * In-process clustering oracle on a genogrove interval index
 *
 * 1. Exons of all unfiltered reference and de novo transcripts are inserted
 *    into one grove index per sequence (and strand, when stranded). The
 *    first and last ignore_bases of each transcript are trimmed first so
 *    that short end overlaps between neighbouring genes do not merge them.
 * 2. Transcripts sharing an exonic base after trimming are joined (union-find).
 * 3. Within each cluster, members sharing no exonic base with a transcript
 *    are reported as its exon conflicts.
 *
 * Cluster ids are assigned from 1 in coordinate order of the first member.
 */
class grove_clusterer : public cluster_oracle {
public:
    explicit grove_clusterer(int order = 3) : order_(order) {}

    cluster_table run(const transcript_index& index, const config& cfg) override;

    std::string name() const override { return "grove"; }

    /**
     * Exons with the transcript's outer ends trimmed by ignore_bases;
     * exons that become empty are dropped
     */
    static std::vector<exon_interval> trimmed_exons(const transcript& tx, size_t ignore_bases);

private:
    int order_;
};

#endif // PARENTAGE_GROVE_CLUSTERER_HPP
