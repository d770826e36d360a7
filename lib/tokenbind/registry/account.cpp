/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/ledger/abi.hpp>
#include "account.hpp"
#include "artifact.hpp"

namespace tokenbind::registry {
    token_ref_t account_t::token(const buffer code)
    {
        if (code.size() != artifact::runtime_size) [[unlikely]]
            throw error(fmt::format("account code must have {} bytes but got {}", artifact::runtime_size, code.size()));
        return {
            uint256_t::from_word(code.subbuf(artifact::chain_id_offset, 32)),
            ledger::abi::address_from_word(ledger::abi::word_at(code.subbuf(artifact::token_contract_offset), 0)),
            uint256_t::from_word(code.subbuf(artifact::token_id_offset, 32))
        };
    }

    account_t::account_t(const address_t &addr, const ledger::ledger_t &ledger):
        _addr { addr },
        _ledger { ledger }
    {
    }

    token_ref_t account_t::token() const
    {
        const auto code = _ledger.code_at(_addr);
        if (code.empty()) [[unlikely]]
            throw error(fmt::format("there is no account at {}", _addr));
        return token(code);
    }

    binding_t account_t::binding() const
    {
        auto b = artifact::parse(_ledger.code_at(_addr));
        if (!b) [[unlikely]]
            throw error(fmt::format("the code at {} is not a token-bound account", _addr));
        return std::move(*b);
    }
}
