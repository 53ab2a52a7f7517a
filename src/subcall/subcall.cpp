/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include <filesystem>
#include <stdexcept>

#include "utility.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Input")
        ("f,filtered", "Filtered transMap transcripts (genePred, may be gzipped)",
            cxxopts::value<std::string>())
        ("u,unfiltered", "Unfiltered transMap transcripts (genePred, superset of --filtered)",
            cxxopts::value<std::string>())
        ("d,denovo", "De novo transcripts (genePred)",
            cxxopts::value<std::string>())
        ("ignore-strand", "Cluster and compare transcripts regardless of strand")
        ;

    options.add_options("Clustering")
        ("oracle", "Clustering backend: clusterGenes or grove",
            cxxopts::value<std::string>()->default_value("clusterGenes"))
        ("cluster-genes", "Path to the clusterGenes executable",
            cxxopts::value<std::string>()->default_value("clusterGenes"))
        ("ignore-bases", "Ignore exon overlaps of up to this many bases at transcript ends",
            cxxopts::value<size_t>()->default_value("10"))
        ("k,order", "Genogrove tree order (grove backend)",
            cxxopts::value<int>()->default_value("3"))
        ;

    options.add_options("Common")
        ("o,output-dir", "Output directory for results (default: de novo input directory)",
            cxxopts::value<std::string>())
        ("p,prefix", "Basename for output files (default: de novo input stem)",
            cxxopts::value<std::string>())
        ("t,threads", "Number of threads (0 = auto-detect)",
            cxxopts::value<uint32_t>()->default_value("1"))
        ("progress", "Show progress output")
        ("h,help", "Show help message")
        ;
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    if (args.count("progress")) {
        logging::set_progress_enabled(true);
    }
}

void subcall::validate_inputs(const cxxopts::ParseResult& args) {
    for (const auto& option : {"filtered", "unfiltered", "denovo"}) {
        if (!args.count(option)) {
            throw std::runtime_error(std::string("No ") + option +
                                     " transcripts specified. Use --" + option);
        }
        std::string path = args[option].as<std::string>();
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Input file not found: " + path);
        }
    }

    std::string oracle = args["oracle"].as<std::string>();
    if (oracle != "clusterGenes" && oracle != "grove") {
        throw std::runtime_error("Unknown --oracle '" + oracle + "' (expected clusterGenes or grove)");
    }
    if (args["order"].as<int>() < 2) {
        throw std::runtime_error("Genogrove tree order must be at least 2");
    }
}

std::filesystem::path subcall::resolve_output_dir(const cxxopts::ParseResult& args,
                                                   const std::string& fallback_input_path) const {
    std::filesystem::path dir;

    if (args.count("output-dir")) {
        dir = args["output-dir"].as<std::string>();
    } else if (!fallback_input_path.empty()) {
        dir = std::filesystem::path(fallback_input_path).parent_path();
    }

    if (dir.empty()) {
        dir = std::filesystem::current_path();
    }

    std::filesystem::create_directories(dir);
    return dir;
}

std::string subcall::output_basename(const cxxopts::ParseResult& args) {
    if (args.count("prefix")) {
        return args["prefix"].as<std::string>();
    }

    std::filesystem::path denovo = args["denovo"].as<std::string>();
    // Strip .gz and the genePred extension
    if (denovo.extension() == ".gz") {
        denovo = denovo.stem();
    }
    std::string stem = denovo.stem().string();
    return stem.empty() ? "parentage" : stem;
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    load_index(args);
    run_oracle(args);
    execute(args);
}

void subcall::load_index(const cxxopts::ParseResult& args) {
    bool stranded = !args.count("ignore-strand");

    index = std::make_unique<transcript_index>(transcript_index::from_files(
        args["filtered"].as<std::string>(),
        args["unfiltered"].as<std::string>(),
        args["denovo"].as<std::string>(),
        stranded));
}

void subcall::run_oracle(const cxxopts::ParseResult& args) {
    if (!index) {
        throw std::runtime_error("Transcripts not loaded before clustering");
    }

    cluster_oracle::config cfg;
    cfg.stranded = !args.count("ignore-strand");
    cfg.ignore_bases = args["ignore-bases"].as<size_t>();

    auto oracle = cluster_oracle::create(args["oracle"].as<std::string>(),
                                         args["cluster-genes"].as<std::string>(),
                                         args["order"].as<int>());

    logging::info("Clustering transcripts with " + oracle->name() +
                  (cfg.stranded ? " (stranded)" : " (ignoring strand)"));
    clusters = oracle->run(*index, cfg);
}

} // namespace subcall
