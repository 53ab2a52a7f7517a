/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "assignment_record.hpp"

#include <vector>

#include "utility.hpp"

std::string method_to_string(resolution_method method) {
    switch (method) {
        case resolution_method::RESCUED: return "rescued";
        case resolution_method::BAD_ANNOT_OR_TM: return "badAnnotOrTm";
        case resolution_method::AMBIGUOUS_OR_FUSION: return "ambiguousOrFusion";
        default: return "unknown";
    }
}

std::optional<std::string> assignment_record::alternatives_string() const {
    if (alternative_gene_ids.empty()) return std::nullopt;
    return util::join(std::vector<std::string>(alternative_gene_ids.begin(),
                                               alternative_gene_ids.end()), ",");
}
