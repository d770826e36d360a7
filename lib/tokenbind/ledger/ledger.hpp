#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <mutex>
#include <type_traits>
#include <tokenbind/storage/update.hpp>
#include "errors.hpp"
#include "types.hpp"

namespace tokenbind::ledger {
    // The gas schedule of the operations the ledger supports.
    struct config_t {
        uint64_t create_gas = 32000;
        uint64_t code_deposit_gas = 200;
        uint64_t hash_word_gas = 6;
        uint64_t code_read_gas = 2600;
        uint64_t log_gas = 375;
        uint64_t log_topic_gas = 375;
        uint64_t log_data_gas = 8;
        uint64_t default_gas_limit = 30'000'000;
        uint64_t max_code_size = 24576;

        void serialize(auto &archive)
        {
            archive.process("create_gas"sv, create_gas);
            archive.process("code_deposit_gas"sv, code_deposit_gas);
            archive.process("hash_word_gas"sv, hash_word_gas);
            archive.process("code_read_gas"sv, code_read_gas);
            archive.process("log_gas"sv, log_gas);
            archive.process("log_topic_gas"sv, log_topic_gas);
            archive.process("log_data_gas"sv, log_data_gas);
            archive.process("default_gas_limit"sv, default_gas_limit);
            archive.process("max_code_size"sv, max_code_size);
        }
    };

    struct account_state_t {
        address_t address {};
        uint64_t nonce = 0;
        codec::byte_sequence_t code {};

        void serialize(auto &archive)
        {
            archive.process("address"sv, address);
            archive.process("nonce"sv, nonce);
            archive.process("code"sv, code);
        }

        bool operator==(const account_state_t &o) const = default;
    };

    // A complete copy of the ledger state used for inspection and test fixtures.
    struct snapshot_t {
        codec::sequence_t<account_state_t> accounts {};
        log_list_t logs {};

        void serialize(auto &archive)
        {
            archive.process("accounts"sv, accounts);
            archive.process("logs"sv, logs);
        }

        bool operator==(const snapshot_t &o) const = default;
    };

    struct ledger_t;

    // The view of the ledger available to a running transaction.
    // All writes go to an overlay that is applied only when the transaction completes without an exception.
    struct transaction_t {
        transaction_t(const transaction_t &) = delete;

        [[nodiscard]] const address_t &sender() const noexcept
        {
            return _sender;
        }

        [[nodiscard]] uint64_t gas_limit() const noexcept
        {
            return _gas_limit;
        }

        [[nodiscard]] uint64_t gas_used() const noexcept
        {
            return _gas_used;
        }

        void charge(uint64_t gas);
        uint8_vector code_at(const address_t &addr);
        [[nodiscard]] uint64_t nonce_at(const address_t &addr) const;
        address_t create2(const address_t &deployer, const bytes32_t &salt, buffer init_code);
        void emit(const log_t &log);
    private:
        friend ledger_t;

        const config_t &_cfg;
        storage::update::db_t _db;
        address_t _sender;
        uint64_t _gas_limit;
        uint64_t _gas_used = 0;

        transaction_t(const config_t &cfg, storage::db_ptr_t db, const address_t &sender, uint64_t gas_limit);
        void _commit();
    };

    // An in-process execution ledger: code and nonces per address, an append-only event log
    // and serialized all-or-nothing transactions.
    struct ledger_t {
        explicit ledger_t(storage::db_ptr_t db, const config_t &cfg={});
        ledger_t(const ledger_t &) = delete;

        [[nodiscard]] const config_t &config() const noexcept
        {
            return _cfg;
        }

        [[nodiscard]] uint8_vector code_at(const address_t &addr) const;
        [[nodiscard]] uint64_t nonce_at(const address_t &addr) const;
        [[nodiscard]] log_list_t logs() const;
        [[nodiscard]] size_t num_logs() const;
        [[nodiscard]] snapshot_t snapshot() const;
        [[nodiscard]] boost::json::value to_json() const;
        // Replaces the whole state with the given snapshot in a single storage batch.
        void restore(const snapshot_t &snap);
        void from_json(const boost::json::value &jv);

        // Runs the action on a new transaction. Transactions never interleave, also with
        // transactions of other ledger instances and processes sharing the same persistent storage.
        // The action must use only the transaction to access the ledger's state.
        template<typename F>
        auto transact(const address_t &sender, const uint64_t gas_limit, const F &action)
        {
            std::scoped_lock lk { _mutex };
            std::scoped_lock db_lk { *_db };
            transaction_t tx { _cfg, _db, sender, gas_limit };
            if constexpr (std::is_void_v<std::invoke_result_t<const F &, transaction_t &>>) {
                action(tx);
                tx._commit();
            } else {
                auto res = action(tx);
                tx._commit();
                return res;
            }
        }

        template<typename F>
        auto transact(const address_t &sender, const F &action)
        {
            return transact(sender, _cfg.default_gas_limit, action);
        }
    private:
        const config_t _cfg;
        storage::db_ptr_t _db;
        mutable std::mutex _mutex {};
    };
}
