#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/ledger/types.hpp>

namespace tokenbind::registry {
    using ledger::address_t;
    using ledger::bytes32_t;
    using ledger::selector_t;
    using ledger::uint256_t;
    using namespace std::string_view_literals;

    // The token a binding is attached to.
    struct token_ref_t {
        uint256_t chain_id {};
        address_t token_contract {};
        uint256_t token_id {};

        void serialize(auto &archive)
        {
            archive.process("chain_id"sv, chain_id);
            archive.process("token_contract"sv, token_contract);
            archive.process("token_id"sv, token_id);
        }

        bool operator==(const token_ref_t &o) const = default;
    };

    // Identifies exactly one service account: equal bindings derive the same address.
    struct binding_t {
        address_t implementation {};
        bytes32_t salt {};
        uint256_t chain_id {};
        address_t token_contract {};
        uint256_t token_id {};

        // Parses the textual form used by the command-line tool:
        // 0x-prefixed hex for addresses and the salt, decimal or 0x-hex for integers.
        static binding_t from_strings(std::string_view implementation, std::string_view salt,
            std::string_view chain_id, std::string_view token_contract, std::string_view token_id);

        // The 128-byte record appended to the deployed code: salt, chain id, token contract and token id words.
        [[nodiscard]] uint8_vector data_record() const;

        [[nodiscard]] token_ref_t token() const
        {
            return { chain_id, token_contract, token_id };
        }

        void serialize(auto &archive)
        {
            archive.process("implementation"sv, implementation);
            archive.process("salt"sv, salt);
            archive.process("chain_id"sv, chain_id);
            archive.process("token_contract"sv, token_contract);
            archive.process("token_id"sv, token_id);
        }

        bool operator==(const binding_t &o) const = default;
        std::strong_ordering operator<=>(const binding_t &o) const = default;
    };
}
