/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "genepred_reader.hpp"

// standard
#include <algorithm>
#include <stdexcept>

// class
#include "utility.hpp"

namespace {
    size_t parse_coordinate(const std::string& field, const std::string& what,
                            const std::string& where) {
        if (!util::is_digits(field)) {
            throw std::runtime_error(where + ": invalid " + what + " '" + field + "'");
        }
        try {
            return std::stoull(field);
        } catch (const std::out_of_range&) {
            throw std::runtime_error(where + ": " + what + " out of range '" + field + "'");
        }
    }

    std::vector<size_t> parse_coordinate_list(const std::string& field, const std::string& what,
                                              const std::string& where) {
        std::vector<size_t> values;
        for (const auto& item : util::split(field, ',')) {
            values.push_back(parse_coordinate(item, what, where));
        }
        return values;
    }
}

genepred_reader::genepred_reader(const std::filesystem::path& filepath,
                                 transcript_source source, bool stranded)
    : file_reader(filepath), file(nullptr), source(source), stranded(stranded) {

    file = gzopen(filepath.string().c_str(), "rb");
    if (!file) {
        throw std::runtime_error("Failed to open genePred file: " + filepath.string());
    }
}

genepred_reader::~genepred_reader() {
    if (file) {
        gzclose(file);
    }
}

bool genepred_reader::read_line(std::string& line) {
    line.clear();
    char buffer[8192];

    while (gzgets(file, buffer, sizeof(buffer)) != nullptr) {
        line.append(buffer);
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
    }

    int errnum = 0;
    const char* msg = gzerror(file, &errnum);
    if (errnum != Z_OK && errnum != Z_STREAM_END) {
        error_message = msg ? msg : "unknown zlib error";
        throw std::runtime_error("Error reading " + path.string() + ": " + error_message);
    }

    // Last line without newline
    return !line.empty();
}

bool genepred_reader::read_next(transcript& entry) {
    std::string line;

    while (read_line(line)) {
        line_num++;

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        parse_line(line, entry);
        return true;
    }

    eof_reached = true;
    return false;
}

void genepred_reader::parse_line(const std::string& line, transcript& entry) {
    auto fields = util::split(line, '\t');
    if (fields.size() < 12) {
        error_message = "expected at least 12 columns (extended genePred), found " +
                        std::to_string(fields.size());
        throw std::runtime_error(location() + ": " + error_message);
    }

    entry = transcript();
    entry.source = source;
    entry.id = fields[0];
    entry.seqid = fields[1];
    entry.gene_id = fields[11];

    if (entry.id.empty() || entry.gene_id.empty()) {
        error_message = "empty transcript or gene identifier";
        throw std::runtime_error(location() + ": " + error_message);
    }

    if (fields[2] != "+" && fields[2] != "-") {
        error_message = "invalid strand '" + fields[2] + "'";
        throw std::runtime_error(location() + ": " + error_message);
    }
    entry.strand = stranded ? fields[2][0] : '.';

    const std::string where = location();
    entry.tx_start = parse_coordinate(fields[3], "txStart", where);
    entry.tx_end = parse_coordinate(fields[4], "txEnd", where);
    entry.cds_start = parse_coordinate(fields[5], "cdsStart", where);
    entry.cds_end = parse_coordinate(fields[6], "cdsEnd", where);
    size_t exon_count = parse_coordinate(fields[7], "exonCount", where);

    auto starts = parse_coordinate_list(fields[8], "exonStarts", where);
    auto ends = parse_coordinate_list(fields[9], "exonEnds", where);

    if (starts.size() != exon_count || ends.size() != exon_count) {
        error_message = "exonCount does not match exon lists";
        throw std::runtime_error(where + ": " + error_message);
    }

    entry.exons.reserve(exon_count);
    for (size_t i = 0; i < exon_count; ++i) {
        if (ends[i] < starts[i]) {
            error_message = "exon end before start";
            throw std::runtime_error(where + ": " + error_message);
        }
        entry.exons.emplace_back(starts[i], ends[i]);
    }
    std::sort(entry.exons.begin(), entry.exons.end());
}

std::vector<transcript> genepred_reader::read_all(const std::filesystem::path& filepath,
                                                  transcript_source source,
                                                  bool stranded) {
    std::vector<transcript> transcripts;
    genepred_reader reader(filepath, source, stranded);

    transcript entry;
    while (reader.read_next(entry)) {
        transcripts.push_back(std::move(entry));
    }

    return transcripts;
}
