/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/assign.hpp"

#include <filesystem>
#include <stdexcept>

#include "cluster_partitioner.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options assign::parse_args(int argc, char** argv) {
    cxxopts::Options options("parentage assign",
        "Assign de novo transcripts to parent genes");

    options.add_options("Assignment")
        ("min-distance", "Minimum overlap for an assignment and minimum score margin between genes",
            cxxopts::value<double>()->default_value("0.4"))
        ("tm-jaccard-distance", "Gene-gene Jaccard above which candidate genes are flagged badAnnotOrTm",
            cxxopts::value<double>()->default_value("0.25"))
        ;

    add_common_options(options);

    return options;
}

void assign::validate(const cxxopts::ParseResult& args) {
    validate_inputs(args);

    double min_distance = args["min-distance"].as<double>();
    if (min_distance < 0.0 || min_distance > 1.0) {
        throw std::runtime_error("--min-distance must be within [0, 1]");
    }

    double tm_jaccard = args["tm-jaccard-distance"].as<double>();
    if (tm_jaccard < 0.0 || tm_jaccard > 1.0) {
        throw std::runtime_error("--tm-jaccard-distance must be within [0, 1]");
    }
}

gene_assigner::config assign::make_config(const cxxopts::ParseResult& args) {
    gene_assigner::config cfg;
    cfg.resolver.min_distance = args["min-distance"].as<double>();
    cfg.resolver.tm_jaccard_distance = args["tm-jaccard-distance"].as<double>();
    cfg.threads = args["threads"].as<uint32_t>();
    return cfg;
}

void assign::execute(const cxxopts::ParseResult& args) {
    if (!index) {
        throw std::runtime_error("Transcripts not available for assignment");
    }

    cluster_partitioner partitioner(*index);
    auto partitions = partitioner.partition(clusters);

    gene_assigner assigner(*index, make_config(args));
    auto records = assigner.assign(partitions);

    const auto& stats = assigner.get_stats();
    logging::info("Assigned " + std::to_string(stats.assigned + stats.rescued) + " of " +
                  std::to_string(stats.total) + " de novo transcript(s) to a parent gene");

    size_t unclustered = index->size(transcript_source::DENOVO) - stats.total;
    if (unclustered > 0) {
        logging::warning(std::to_string(unclustered) +
                         " de novo transcript(s) were not reported by the clustering oracle");
    }

    std::string denovo_path = args["denovo"].as<std::string>();
    auto out_dir = resolve_output_dir(args, denovo_path);
    std::string basename = output_basename(args);

    std::string results_path = (out_dir / (basename + ".parent_genes.tsv")).string();
    gene_assigner::write_results(results_path, records);

    std::string summary_path = (out_dir / (basename + ".parent_genes.summary.txt")).string();
    assigner.write_summary(summary_path);
}

} // namespace subcall
