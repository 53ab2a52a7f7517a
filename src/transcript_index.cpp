/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "transcript_index.hpp"

#include <algorithm>

#include "genepred_reader.hpp"
#include "utility.hpp"

transcript_index transcript_index::from_files(const std::filesystem::path& filtered_path,
                                              const std::filesystem::path& unfiltered_path,
                                              const std::filesystem::path& denovo_path,
                                              bool stranded) {
    transcript_index index;

    auto load = [&index, stranded](const std::filesystem::path& path, transcript_source source) {
        logging::info("Loading " + source_to_string(source) + " transcripts: " + path.string());
        auto transcripts = genepred_reader::read_all(path, source, stranded);
        for (auto& tx : transcripts) {
            index.add(std::move(tx));
        }
        logging::info("Loaded " + std::to_string(index.size(source)) + " " +
                      source_to_string(source) + " transcripts");
    };

    load(filtered_path, transcript_source::FILTERED_REFERENCE);
    load(unfiltered_path, transcript_source::UNFILTERED_REFERENCE);
    load(denovo_path, transcript_source::DENOVO);

    // Filtered models should be a subset of the unfiltered ones
    size_t missing = 0;
    for (const auto& [id, tx] : index.filtered_) {
        if (!index.unfiltered_.contains(id)) missing++;
    }
    if (missing > 0) {
        logging::warning(std::to_string(missing) +
                         " filtered transcript(s) are absent from the unfiltered set");
    }

    return index;
}

void transcript_index::add(transcript tx) {
    auto& map = partition(tx.source);
    std::string id = tx.id;
    auto [it, inserted] = map.emplace(id, std::move(tx));
    if (!inserted) {
        throw std::runtime_error("Duplicate transcript identifier '" + id + "' in " +
                                 source_to_string(it->second.source) + " transcripts");
    }
}

const transcript* transcript_index::find(transcript_source source, const std::string& id) const {
    const auto& map = partition(source);
    auto it = map.find(id);
    return it == map.end() ? nullptr : &it->second;
}

const transcript& transcript_index::at(transcript_source source, const std::string& id) const {
    const transcript* tx = find(source, id);
    if (tx == nullptr) {
        throw missing_transcript_error(id, source);
    }
    return *tx;
}

std::vector<const transcript*> transcript_index::sorted(transcript_source source) const {
    std::vector<const transcript*> result;
    const auto& map = partition(source);
    result.reserve(map.size());
    for (const auto& [id, tx] : map) {
        result.push_back(&tx);
    }

    std::sort(result.begin(), result.end(), [](const transcript* a, const transcript* b) {
        if (a->seqid != b->seqid) return a->seqid < b->seqid;
        if (a->tx_start != b->tx_start) return a->tx_start < b->tx_start;
        return a->id < b->id;
    });

    return result;
}

const transcript_index::partition_map& transcript_index::partition(transcript_source source) const {
    switch (source) {
        case transcript_source::DENOVO: return denovo_;
        case transcript_source::FILTERED_REFERENCE: return filtered_;
        default: return unfiltered_;
    }
}

transcript_index::partition_map& transcript_index::partition(transcript_source source) {
    switch (source) {
        case transcript_source::DENOVO: return denovo_;
        case transcript_source::FILTERED_REFERENCE: return filtered_;
        default: return unfiltered_;
    }
}
