/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of blobsift and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "diagnostics.hpp"

#include <algorithm>

#include "utility.hpp"

bool diagnostics::contains(const std::string& fragment) const {
    return std::any_of(warnings_.begin(), warnings_.end(),
        [&fragment](const std::string& w) { return w.find(fragment) != std::string::npos; });
}

void diagnostics::merge(const diagnostics& other) {
    warnings_.insert(warnings_.end(), other.warnings_.begin(), other.warnings_.end());
}

void diagnostics::report() const {
    for (const auto& w : warnings_) {
        logging::warning(w);
    }
}
