/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_SUBCALL_CLUSTER_HPP
#define PARENTAGE_SUBCALL_CLUSTER_HPP

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Cluster subcommand: run the clustering oracle only.
 *
 * Writes the cluster table (clusterGenes -conflicted layout) so the
 * clustering behind an assignment run can be inspected.
 */
class cluster : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "cluster"; }
    std::string description() const override {
        return "Cluster reference and de novo transcripts";
    }
};

} // namespace subcall

#endif // PARENTAGE_SUBCALL_CLUSTER_HPP
