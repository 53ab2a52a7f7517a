/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "cluster_genes_runner.hpp"

// standard
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

// posix
#include <sys/wait.h>
#include <unistd.h>

#include "utility.hpp"

namespace {
    // Removes the scratch directory when the run finishes or throws
    struct scratch_dir {
        std::filesystem::path path;

        scratch_dir() {
            std::string pattern =
                (std::filesystem::temp_directory_path() / "parentage.XXXXXX").string();
            std::vector<char> buffer(pattern.begin(), pattern.end());
            buffer.push_back('\0');
            if (mkdtemp(buffer.data()) == nullptr) {
                throw oracle_error("Could not create temporary directory from " + pattern);
            }
            path = buffer.data();
        }

        ~scratch_dir() {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    };

    std::string shell_quote(const std::string& arg) {
        std::string quoted = "'";
        for (char c : arg) {
            if (c == '\'') {
                quoted += "'\\''";
            } else {
                quoted += c;
            }
        }
        return quoted + "'";
    }

    void write_file(const std::filesystem::path& path,
                    const std::vector<const transcript*>& transcripts) {
        std::ofstream out(path);
        if (!out.is_open()) {
            throw oracle_error("Could not write clustering input: " + path.string());
        }
        cluster_genes_runner::write_genepred(out, transcripts);
        if (!out) {
            throw oracle_error("Failed writing clustering input: " + path.string());
        }
    }
}

void cluster_genes_runner::write_genepred(std::ostream& out,
                                          const std::vector<const transcript*>& transcripts) {
    for (const auto* tx : transcripts) {
        std::ostringstream starts;
        std::ostringstream ends;
        std::ostringstream frames;
        for (const auto& exon : tx->exons) {
            starts << exon.start << ",";
            ends << exon.end << ",";
            frames << "-1,";
        }

        out << tx->id << "\t"
            << tx->seqid << "\t"
            << (tx->strand == '-' ? '-' : '+') << "\t"
            << tx->tx_start << "\t"
            << tx->tx_end << "\t"
            << tx->cds_start << "\t"
            << tx->cds_end << "\t"
            << tx->exons.size() << "\t"
            << starts.str() << "\t"
            << ends.str() << "\t"
            << 0 << "\t"
            << tx->gene_id << "\t"
            << "unk\t"
            << "unk\t"
            << frames.str() << "\n";
    }
}

std::string cluster_genes_runner::build_command(const std::filesystem::path& output,
                                                const std::filesystem::path& reference,
                                                const std::filesystem::path& denovo,
                                                const config& cfg) const {
    std::ostringstream cmd;
    cmd << shell_quote(executable_)
        << " -ignoreBases=" << cfg.ignore_bases
        << " -conflicted";
    if (!cfg.stranded) {
        cmd << " -ignoreStrand";
    }
    cmd << " " << shell_quote(output.string())
        << " no"
        << " " << shell_quote(reference.string())
        << " " << shell_quote(denovo.string());
    return cmd.str();
}

cluster_table cluster_genes_runner::run(const transcript_index& index, const config& cfg) {
    scratch_dir scratch;

    auto reference_path = scratch.path / "reference.gp";
    auto denovo_path = scratch.path / "denovo.gp";
    auto output_path = scratch.path / "clusters.tsv";

    write_file(reference_path, index.sorted(transcript_source::UNFILTERED_REFERENCE));
    write_file(denovo_path, index.sorted(transcript_source::DENOVO));

    std::string cmd = build_command(output_path, reference_path, denovo_path, cfg);
    logging::info("Running: " + cmd);

    FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
    if (pipe == nullptr) {
        throw oracle_error("Failed to start " + executable_);
    }

    std::string messages;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        messages += buffer;
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::string reason = (status != -1 && WIFEXITED(status))
            ? "exit status " + std::to_string(WEXITSTATUS(status))
            : "abnormal termination";
        throw oracle_error(executable_ + " failed (" + reason + ")" +
                           (messages.empty() ? "" : ": " + messages));
    }

    std::ifstream in(output_path);
    if (!in.is_open()) {
        throw oracle_error(executable_ + " produced no output: " + output_path.string());
    }

    // clusterGenes names tables after the file argument
    cluster_table::table_names tables = {
        {reference_path.string(), transcript_source::UNFILTERED_REFERENCE},
        {reference_path.filename().string(), transcript_source::UNFILTERED_REFERENCE},
        {reference_path.stem().string(), transcript_source::UNFILTERED_REFERENCE},
        {denovo_path.string(), transcript_source::DENOVO},
        {denovo_path.filename().string(), transcript_source::DENOVO},
        {denovo_path.stem().string(), transcript_source::DENOVO},
    };

    cluster_table table = cluster_table::parse(in, tables);
    logging::info(executable_ + " reported " + std::to_string(table.cluster_count()) +
                  " cluster(s) over " + std::to_string(table.size()) + " transcript(s)");
    return table;
}
