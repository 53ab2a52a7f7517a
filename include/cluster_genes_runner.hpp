/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_CLUSTER_GENES_RUNNER_HPP
#define PARENTAGE_CLUSTER_GENES_RUNNER_HPP

// standard
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

// class
#include "cluster_oracle.hpp"

/**
 * Clustering oracle backed by the UCSC clusterGenes executable
 *
 * Writes the unfiltered reference and de novo partitions to temporary
 * genePred files and runs
 *   clusterGenes -ignoreBases=N -conflicted [-ignoreStrand] out.tsv no ref.gp denovo.gp
 * A non-zero exit status or unparsable output raises oracle_error.
 */
class cluster_genes_runner : public cluster_oracle {
public:
    explicit cluster_genes_runner(std::string executable = "clusterGenes")
        : executable_(std::move(executable)) {}

    cluster_table run(const transcript_index& index, const config& cfg) override;

    std::string name() const override { return "clusterGenes"; }

    /**
     * Write transcripts as extended genePred (one line each)
     */
    static void write_genepred(std::ostream& out, const std::vector<const transcript*>& transcripts);

    /**
     * Build the command line for the given input/output files
     */
    std::string build_command(const std::filesystem::path& output,
                              const std::filesystem::path& reference,
                              const std::filesystem::path& denovo,
                              const config& cfg) const;

private:
    std::string executable_;
};

#endif // PARENTAGE_CLUSTER_GENES_RUNNER_HPP
