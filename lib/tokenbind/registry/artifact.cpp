/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/ledger/abi.hpp>
#include <tokenbind/ledger/create2.hpp>
#include "artifact.hpp"

namespace tokenbind::registry::artifact {
    const byte_array<header_size> &header()
    {
        static const auto h = byte_array<header_size>::from_hex("363d3d373d3d3d363d73");
        return h;
    }

    const byte_array<footer_size> &footer()
    {
        static const auto f = byte_array<footer_size>::from_hex("5af43d82803e903d91602b57fd5bf3");
        return f;
    }

    uint8_vector runtime_code(const binding_t &b)
    {
        uint8_vector code {};
        code.reserve(runtime_size);
        code << header() << b.implementation << footer() << b.data_record();
        if (code.size() != runtime_size) [[unlikely]]
            throw error(fmt::format("internal error: the account code has {} bytes instead of {}", code.size(), runtime_size));
        return code;
    }

    uint8_vector init_code(const binding_t &b)
    {
        return ledger::create2::init_code(runtime_code(b));
    }

    std::optional<binding_t> parse(const buffer code)
    {
        if (code.size() != runtime_size
                || code.subbuf(0, header_size) != buffer { header() }
                || code.subbuf(footer_offset, footer_size) != buffer { footer() })
            return {};
        const auto contract_word = ledger::abi::word_at(code.subbuf(token_contract_offset), 0);
        if (!buffer { contract_word }.subbuf(0, 12).all_zero())
            return {};
        return binding_t {
            address_t { code.subbuf(implementation_offset, 20) },
            bytes32_t { code.subbuf(salt_offset, 32) },
            uint256_t::from_word(code.subbuf(chain_id_offset, 32)),
            ledger::abi::address_from_word(contract_word),
            uint256_t::from_word(code.subbuf(token_id_offset, 32))
        };
    }
}
