/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef PARENTAGE_FILE_READER_HPP
#define PARENTAGE_FILE_READER_HPP

#include <filesystem>
#include <string>
#include <utility>

/**
 * Shared state of line-oriented annotation readers: source path, current line
 * and the last error, formatted as "file:line" for exceptions
 */
class file_reader_base {
    public:
        explicit file_reader_base(std::filesystem::path filepath)
            : path(std::move(filepath)), line_num(0), eof_reached(false) {}
        virtual ~file_reader_base() = default;

        bool has_next() const { return !eof_reached; }
        std::string get_error_message() const { return error_message; }
        size_t get_current_line() const { return line_num; }
        const std::filesystem::path& get_path() const { return path; }

    protected:
        std::filesystem::path path;
        size_t line_num;
        bool eof_reached;
        std::string error_message;

        std::string location() const {
            return path.string() + ":" + std::to_string(line_num);
        }
};

// Typed reader producing one entry per data line
template<typename EntryType>
class file_reader : public file_reader_base {
    public:
        using file_reader_base::file_reader_base;
        virtual bool read_next(EntryType& entry) = 0;
};

#endif //PARENTAGE_FILE_READER_HPP
