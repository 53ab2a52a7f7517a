/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "utility.hpp"

// standard
#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace logging {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string YELLOW = "\033[33m";
    const std::string RED = "\033[31m";

    static std::atomic<bool> show_progress{false};
    static std::mutex output_mutex;

    // Internal helper to get timestamp
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t current_time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&current_time), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void info(const std::string& message) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "[PARENTAGE] " << get_timestamp() << " - " << message << std::endl;
    }

    void warning(const std::string& message) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << YELLOW << "[PARENTAGE] " << get_timestamp() << " - WARNING: " << message << RESET << std::endl;
    }

    void error(const std::string& message) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << RED << "[PARENTAGE] " << get_timestamp() << " - ERROR: " << message << RESET << std::endl;
    }

    void set_progress_enabled(bool enabled) {
        show_progress = enabled;
    }

    void progress(size_t count, const std::string& prefix) {
        if (!show_progress) return;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << "\r[PARENTAGE] " << prefix << ": " << count << std::flush;
    }

    void progress_done(size_t count, const std::string& message) {
        if (!show_progress) return;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << "\r[PARENTAGE] " << message << ": " << count << std::endl;
    }
}

namespace util {
    bool is_digits(const std::string& str) {
        return !str.empty() &&
               std::all_of(str.begin(), str.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    std::vector<std::string> split(const std::string& str, char delim) {
        std::vector<std::string> fields;
        if (str.empty()) return fields;

        size_t start = 0;
        while (true) {
            size_t pos = str.find(delim, start);
            if (pos == std::string::npos) {
                if (start < str.size()) {
                    fields.push_back(str.substr(start));
                }
                break;
            }
            fields.push_back(str.substr(start, pos - start));
            start = pos + 1;
        }
        return fields;
    }

    std::string join(const std::vector<std::string>& strs, const std::string& sep) {
        if (strs.empty()) return "";
        std::ostringstream ss;
        for (size_t i = 0; i < strs.size(); ++i) {
            if (i > 0) ss << sep;
            ss << strs[i];
        }
        return ss.str();
    }
}
