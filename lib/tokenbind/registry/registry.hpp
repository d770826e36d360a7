#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <optional>
#include <tokenbind/ledger/ledger.hpp>
#include "binding.hpp"
#include "errors.hpp"

namespace tokenbind::registry {
    // The record of the first deployment of an account.
    struct created_event_t {
        address_t account {};
        binding_t binding {};

        // Created(address,address,bytes32,uint256,address,uint256)
        static const bytes32_t &signature();
        // Returns an empty optional for logs of other events or with a malformed layout.
        static std::optional<created_event_t> from_log(const ledger::log_t &log);

        // Indexed: implementation, token contract and token id. Data: account, salt and chain id.
        [[nodiscard]] ledger::log_t to_log(const address_t &emitter) const;

        void serialize(auto &archive)
        {
            archive.process("account"sv, account);
            archive.process("binding"sv, binding);
        }

        bool operator==(const created_event_t &o) const = default;
    };
    using created_event_list_t = codec::sequence_t<created_event_t>;

    // A registry of token-bound service accounts deployed at a given address of a ledger.
    // Registries keep no state of their own: an account exists iff the ledger has code at its address.
    struct registry_t {
        // The 4-byte interface id: the create selector XOR the compute selector.
        static const selector_t &capability_id();
        // The selector of the CreationFailed() error.
        static const selector_t &creation_failed_selector();

        registry_t(const address_t &addr, ledger::ledger_t &ledger);

        [[nodiscard]] const address_t &address() const noexcept
        {
            return _addr;
        }

        // Deploys the account of the binding unless it exists and returns its address.
        // Throws err_creation_failed_t if the deployment fails.
        address_t create(const address_t &sender, const binding_t &b, std::optional<uint64_t> gas_limit={});
        // Variant for callers that already run a ledger transaction.
        address_t create(ledger::transaction_t &tx, const binding_t &b) const;
        [[nodiscard]] address_t compute(const binding_t &b) const;
        [[nodiscard]] static bool supports(const selector_t &interface_id);
        // All accounts this registry has created, in the order of creation.
        [[nodiscard]] created_event_list_t events() const;
    private:
        address_t _addr;
        ledger::ledger_t &_ledger;
    };
}
