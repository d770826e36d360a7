/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/ledger/abi.hpp>
#include "binding.hpp"

namespace tokenbind::registry {
    binding_t binding_t::from_strings(const std::string_view implementation, const std::string_view salt,
        const std::string_view chain_id, const std::string_view token_contract, const std::string_view token_id)
    {
        return {
            address_t::from_hex(implementation),
            bytes32_t::from_hex(salt),
            uint256_t::from_string(chain_id),
            address_t::from_hex(token_contract),
            uint256_t::from_string(token_id)
        };
    }

    uint8_vector binding_t::data_record() const
    {
        return ledger::abi::encode({ salt, ledger::abi::word(chain_id), ledger::abi::word(token_contract), ledger::abi::word(token_id) });
    }
}
