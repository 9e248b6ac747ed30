/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_RECORD_READER_HPP
#define BLOBSIFT_RECORD_READER_HPP

#include <string>

/**
 * Sequential reader over the records of a companion or alignment file.
 *
 * read_next() returns false at the end of the input and on malformed
 * input; get_error_message() is non-empty only in the second case.
 */
template<typename EntryType>
class record_reader {
    public:
        virtual ~record_reader() = default;

        virtual bool read_next(EntryType& entry) = 0;
        virtual bool has_next() = 0;
        virtual std::string get_error_message() = 0;

        // input line (or record) of the last read, for error messages
        virtual size_t get_current_line() = 0;
};

#endif //BLOBSIFT_RECORD_READER_HPP
