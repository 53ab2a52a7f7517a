/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_TRANSCRIPT_INDEX_HPP
#define PARENTAGE_TRANSCRIPT_INDEX_HPP

// standard
#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// class
#include "transcript.hpp"

/**
 * Raised when an identifier referenced by the cluster table or a gene group
 * is not present in the collection that must contain it
 */
class missing_transcript_error : public std::runtime_error {
public:
    missing_transcript_error(const std::string& transcript_id, transcript_source source)
        : std::runtime_error("Transcript '" + transcript_id + "' not found in " +
                             source_to_string(source) + " transcripts"),
          transcript_id(transcript_id), source(source) {}

    std::string transcript_id;
    transcript_source source;
};

/**
 * Read-only lookup of transcript models by identifier, partitioned by source
 *
 * The unfiltered reference partition is expected to be a superset of the
 * filtered one; geometry for reference overlap scoring is always taken from
 * the unfiltered partition since filtered bodies may be trimmed.
 * Safe for concurrent reads after construction.
 */
class transcript_index {
public:
    transcript_index() = default;

    /**
     * Load all three collections from genePred files
     */
    static transcript_index from_files(const std::filesystem::path& filtered_path,
                                       const std::filesystem::path& unfiltered_path,
                                       const std::filesystem::path& denovo_path,
                                       bool stranded = true);

    /**
     * Add a transcript to the partition named by its source tag.
     * Throws std::runtime_error on duplicate identifiers within a partition.
     */
    void add(transcript tx);

    /**
     * @return Transcript or nullptr if not present in the partition
     */
    const transcript* find(transcript_source source, const std::string& id) const;

    /**
     * @throws missing_transcript_error if not present in the partition
     */
    const transcript& at(transcript_source source, const std::string& id) const;

    bool contains(transcript_source source, const std::string& id) const {
        return find(source, id) != nullptr;
    }

    size_t size(transcript_source source) const { return partition(source).size(); }

    /**
     * All transcripts of a partition, ordered by seqid, start, id
     * (coordinate-sorted input for the clustering oracle)
     */
    std::vector<const transcript*> sorted(transcript_source source) const;

private:
    using partition_map = std::unordered_map<std::string, transcript>;

    partition_map denovo_;
    partition_map filtered_;
    partition_map unfiltered_;

    const partition_map& partition(transcript_source source) const;
    partition_map& partition(transcript_source source);
};

#endif // PARENTAGE_TRANSCRIPT_INDEX_HPP
