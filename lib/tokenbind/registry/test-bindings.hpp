#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include "binding.hpp"

namespace tokenbind::registry::test {
    inline const address_t &registry_address()
    {
        static const auto addr = address_t::from_hex("0x4444444444444444444444444444444444444444");
        return addr;
    }

    inline binding_t sample_binding(const uint64_t token_id=42)
    {
        return {
            address_t::from_hex("0x1111111111111111111111111111111111111111"),
            bytes32_t {},
            uint256_t { 1 },
            address_t::from_hex("0x2222222222222222222222222222222222222222"),
            uint256_t { token_id }
        };
    }
}
