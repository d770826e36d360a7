/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/crypto/keccak.hpp>
#include <tokenbind/ledger/create2.hpp>
#include "address.hpp"
#include "artifact.hpp"

namespace tokenbind::registry::address {
    address_t compute(const address_t &deployer, const binding_t &b)
    {
        const auto code_hash = crypto::keccak::digest<bytes32_t>(artifact::init_code(b));
        return ledger::create2::address(deployer, b.salt, code_hash);
    }
}
