#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include "types.hpp"

namespace tokenbind::ledger::create2 {
    // keccak256(0xff ++ deployer ++ salt ++ code_hash)[12:32]
    extern address_t address(const address_t &deployer, const bytes32_t &salt, const bytes32_t &code_hash);
    extern address_t address(const address_t &deployer, const bytes32_t &salt, buffer init_code);

    static constexpr size_t prologue_size = 10;

    // Builds the 10-byte constructor that copies the code following it and returns it:
    // RETURNDATASIZE PUSH1 len DUP1 PUSH1 10 RETURNDATASIZE CODECOPY DUP2 RETURN
    extern uint8_vector init_code(buffer runtime_code);

    // Executes a copy-and-return constructor and returns the code it deploys.
    // Throws err_bad_init_code_t for any other constructor.
    extern uint8_vector run_init_code(buffer init_code);
}
