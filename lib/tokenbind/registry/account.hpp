#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/ledger/ledger.hpp>
#include "binding.hpp"

namespace tokenbind::registry {
    // A read-only view of a deployed account. All the answers come from the account's own code.
    struct account_t {
        // Decodes the token from the code of an account; throws if the code has a different size.
        static token_ref_t token(buffer code);

        account_t(const address_t &addr, const ledger::ledger_t &ledger);

        [[nodiscard]] const address_t &address() const noexcept
        {
            return _addr;
        }

        token_ref_t token() const;
        // The full binding; throws if the code at the address is not an account.
        binding_t binding() const;
    private:
        address_t _addr;
        const ledger::ledger_t &_ledger;
    };
}
