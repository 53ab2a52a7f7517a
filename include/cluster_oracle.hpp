/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_CLUSTER_ORACLE_HPP
#define PARENTAGE_CLUSTER_ORACLE_HPP

// standard
#include <memory>
#include <string>

// class
#include "cluster_table.hpp"
#include "transcript_index.hpp"

/**
 * Groups unfiltered reference and de novo transcripts into overlap clusters
 * and reports exon-level conflicts between cluster members.
 *
 * Called once per run before any per-cluster work. Any failure is fatal and
 * reported as oracle_error.
 */
class cluster_oracle {
public:
    struct config {
        bool stranded = true;       // Only cluster transcripts on the same strand
        size_t ignore_bases = 10;   // Exon overlaps of at most this many bases do not cluster
    };

    virtual ~cluster_oracle() = default;

    /**
     * Cluster the unfiltered reference and de novo partitions of the index
     */
    virtual cluster_table run(const transcript_index& index, const config& cfg) = 0;

    virtual std::string name() const = 0;

    /**
     * Create an oracle by name ("clusterGenes" or "grove")
     * @param executable clusterGenes binary (clusterGenes oracle only)
     * @param order Genogrove tree order (grove oracle only)
     * @throws std::runtime_error for unknown names
     */
    static std::unique_ptr<cluster_oracle> create(const std::string& name,
                                                  const std::string& executable = "clusterGenes",
                                                  int order = 3);
};

#endif // PARENTAGE_CLUSTER_ORACLE_HPP
