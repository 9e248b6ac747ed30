/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef BLOBSIFT_ERRORS_HPP
#define BLOBSIFT_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * A field or metadata document violates the dataset model
 * (value count differs from record count, missing identifiers, bad document shape)
 */
class data_model_error : public std::runtime_error {
public:
    explicit data_model_error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A key name was looked up in a field whose key table does not contain it
 */
class unknown_key_error : public std::runtime_error {
public:
    unknown_key_error(const std::string& field_id, const std::string& key)
        : std::runtime_error("Key '" + key + "' not found in field '" + field_id + "'"),
          key(key) {}

    std::string key;
};

/**
 * A numeric filter parameter could not be parsed
 */
class invalid_parameter_value : public std::runtime_error {
public:
    invalid_parameter_value(const std::string& field_id, const std::string& param,
                            const std::string& value)
        : std::runtime_error("Invalid value '" + value + "' for parameter '" +
                             field_id + "--" + param + "'") {}
};

#endif // BLOBSIFT_ERRORS_HPP
