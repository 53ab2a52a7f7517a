/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "transcript.hpp"

std::string source_to_string(transcript_source source) {
    switch (source) {
        case transcript_source::DENOVO: return "denovo";
        case transcript_source::FILTERED_REFERENCE: return "filtered";
        case transcript_source::UNFILTERED_REFERENCE: return "unfiltered";
        default: return "unknown";
    }
}
