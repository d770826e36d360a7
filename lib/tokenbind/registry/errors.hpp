#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/common/error.hpp>

namespace tokenbind::registry {
    // The account could not be deployed; the transaction that attempted it left no changes.
    struct err_creation_failed_t: error {
        using error::error;
    };
}
