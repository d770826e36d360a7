#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/common/error.hpp>

namespace tokenbind::ledger {
    struct err_out_of_gas_t: error {
        using error::error;
    };
    // The target of a deployment already has code or a non-zero nonce.
    struct err_address_collision_t: error {
        using error::error;
    };
    // Only the copy-and-return constructor prologue can be executed.
    struct err_bad_init_code_t: error {
        using error::error;
    };
}
