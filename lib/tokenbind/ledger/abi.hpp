#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include "types.hpp"

// Helpers for the Ethereum contract ABI: selectors, event topics and 32-byte words.
namespace tokenbind::ledger::abi {
    // The first four bytes of keccak256 of a canonical signature such as "transfer(address,uint256)".
    extern selector_t selector(std::string_view signature);
    extern bytes32_t event_topic(std::string_view signature);

    extern bytes32_t word(const address_t &addr);
    extern bytes32_t word(const uint256_t &val);
    // Throws if the upper 12 bytes are not zero.
    extern address_t address_from_word(const bytes32_t &w);

    // Static-type ABI encoding is the plain concatenation of the words.
    extern uint8_vector encode(std::initializer_list<bytes32_t> words);
    extern bytes32_t word_at(buffer data, size_t idx);
}
