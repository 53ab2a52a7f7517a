/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_UTILITY_HPP
#define PARENTAGE_UTILITY_HPP

// standard
#include <chrono>
#include <string>
#include <vector>

namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Progress output (only printed when enabled via --progress)
    void set_progress_enabled(bool enabled);
    void progress(size_t count, const std::string& prefix);
    void progress_done(size_t count, const std::string& message);
}

namespace util {
    /**
     * Split a string on a single-character delimiter.
     * Empty fields are kept, except for a trailing one after a final delimiter
     * (clusterGenes writes lists as "a,b,")
     */
    std::vector<std::string> split(const std::string& str, char delim);

    // True for a non-empty string of ASCII digits
    bool is_digits(const std::string& str);

    std::string join(const std::vector<std::string>& strs, const std::string& sep);
}

#endif //PARENTAGE_UTILITY_HPP
