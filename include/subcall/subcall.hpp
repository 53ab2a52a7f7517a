/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_SUBCALL_HPP
#define PARENTAGE_SUBCALL_HPP

#include <filesystem>
#include <memory>
#include <string>

#include <cxxopts.hpp>

#include "cluster_oracle.hpp"
#include "cluster_table.hpp"
#include "transcript_index.hpp"

namespace subcall {

/**
 * Abstract base class for all parentage subcommands.
 */
class subcall {
public:
    virtual ~subcall() = default;

    /**
     * Parse command-line arguments and return the options object.
     * The subclass defines its own options here.
     * Should call add_common_options() to include shared options.
     */
    virtual cxxopts::Options parse_args(int argc, char** argv) = 0;

    /**
     * Validate parsed arguments. Throws on invalid input.
     */
    virtual void validate(const cxxopts::ParseResult& args) = 0;

    /**
     * Execute the subcommand (called after transcripts are clustered).
     */
    virtual void execute(const cxxopts::ParseResult& args) = 0;

    /**
     * Template method: validate → apply_common_options → load_index → run_oracle → execute.
     */
    void run(const cxxopts::ParseResult& args);

    /**
     * Add common options shared across all subcommands.
     * Call this in parse_args() implementations.
     */
    static void add_common_options(cxxopts::Options& options);

    /**
     * Get the subcommand name (for help text).
     */
    virtual std::string name() const = 0;

    /**
     * Get brief description (for help text).
     */
    virtual std::string description() const = 0;

protected:
    std::unique_ptr<transcript_index> index;
    cluster_table clusters;
    std::filesystem::path output_dir;

    /**
     * Resolve the output directory from --output-dir or the parent of a fallback path.
     * Creates the directory if it doesn't exist.
     */
    std::filesystem::path resolve_output_dir(const cxxopts::ParseResult& args,
                                             const std::string& fallback_input_path) const;

    /**
     * Output file basename from --prefix or the de novo input file
     */
    static std::string output_basename(const cxxopts::ParseResult& args);

    /**
     * Load the three transcript collections (--filtered, --unfiltered, --denovo)
     */
    void load_index(const cxxopts::ParseResult& args);

    /**
     * Cluster transcripts with the selected oracle (--oracle, --ignore-bases)
     */
    void run_oracle(const cxxopts::ParseResult& args);

    /**
     * Check that the input collections were given and exist
     */
    static void validate_inputs(const cxxopts::ParseResult& args);

private:
    /**
     * Apply common options (threads, progress, etc.)
     */
    static void apply_common_options(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // PARENTAGE_SUBCALL_HPP
