/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_GENEPRED_READER_HPP
#define PARENTAGE_GENEPRED_READER_HPP

// standard
#include <filesystem>
#include <string>
#include <vector>

// zlib
#include <zlib.h>

// class
#include "file_reader.hpp"
#include "transcript.hpp"

/**
 * Reader for extended genePred files (plain or gzipped)
 *
 * Columns: name chrom strand txStart txEnd cdsStart cdsEnd exonCount
 *          exonStarts exonEnds score name2 [cdsStartStat cdsEndStat exonFrames]
 *
 * name is the transcript id, name2 the gene id. Coordinates are 0-based
 * half-open, exon lists are comma separated with an optional trailing comma.
 * Malformed lines throw std::runtime_error naming file and line.
 */
class genepred_reader : public file_reader<transcript> {
public:
    /**
     * @param filepath genePred file (.gz is detected by zlib transparently)
     * @param source Collection tag assigned to every transcript read
     * @param stranded If false, strand is stored as '.'
     */
    genepred_reader(const std::filesystem::path& filepath, transcript_source source,
                    bool stranded = true);
    ~genepred_reader();

    genepred_reader(const genepred_reader&) = delete;
    genepred_reader& operator=(const genepred_reader&) = delete;

    // Read next entry
    bool read_next(transcript& entry) override;

    /**
     * Read a complete file
     */
    static std::vector<transcript> read_all(const std::filesystem::path& filepath,
                                            transcript_source source,
                                            bool stranded = true);

private:
    gzFile file;
    transcript_source source;
    bool stranded;

    bool read_line(std::string& line);

    // Parse a single line into a transcript; throws on malformed input
    void parse_line(const std::string& line, transcript& entry);
};

#endif //PARENTAGE_GENEPRED_READER_HPP
