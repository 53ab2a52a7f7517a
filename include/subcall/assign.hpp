/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_SUBCALL_ASSIGN_HPP
#define PARENTAGE_SUBCALL_ASSIGN_HPP

#include "subcall/subcall.hpp"

#include "gene_assigner.hpp"

namespace subcall {

/**
 * Assign subcommand: parent gene assignment for de novo transcripts.
 *
 * Pipeline:
 * 1. Loads filtered, unfiltered and de novo transcripts
 * 2. Clusters unfiltered and de novo transcripts with the selected oracle
 * 3. Resolves the parent gene of every clustered de novo transcript
 * 4. Writes <prefix>.parent_genes.tsv and <prefix>.parent_genes.summary.txt
 */
class assign : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "assign"; }
    std::string description() const override {
        return "Assign de novo transcripts to parent genes";
    }

private:
    static gene_assigner::config make_config(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // PARENTAGE_SUBCALL_ASSIGN_HPP
