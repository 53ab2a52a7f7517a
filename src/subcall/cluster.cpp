/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/cluster.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "utility.hpp"

namespace subcall {

cxxopts::Options cluster::parse_args(int argc, char** argv) {
    cxxopts::Options options("parentage cluster",
        "Cluster reference and de novo transcripts");

    add_common_options(options);

    return options;
}

void cluster::validate(const cxxopts::ParseResult& args) {
    validate_inputs(args);
}

void cluster::execute(const cxxopts::ParseResult& args) {
    std::string denovo_path = args["denovo"].as<std::string>();
    auto out_dir = resolve_output_dir(args, denovo_path);
    std::string basename = output_basename(args);

    std::string table_path = (out_dir / (basename + ".clusters.tsv")).string();
    std::ofstream out(table_path);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open output file: " + table_path);
    }

    clusters.write(out, {
        {transcript_source::UNFILTERED_REFERENCE, "reference"},
        {transcript_source::DENOVO, "denovo"},
    });

    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + table_path);
    }
    logging::info("Wrote " + std::to_string(clusters.cluster_count()) + " cluster(s) to: " +
                  table_path);
}

} // namespace subcall
