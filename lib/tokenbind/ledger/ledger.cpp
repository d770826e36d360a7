/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <map>
#include <tokenbind/codec/binary.hpp>
#include <tokenbind/common/logger.hpp>
#include "create2.hpp"
#include "ledger.hpp"

namespace tokenbind::ledger {
    namespace {
        static constexpr uint8_t code_prefix = 'c';
        static constexpr uint8_t nonce_prefix = 'n';
        static constexpr uint8_t log_prefix = 'l';
        static const uint8_vector num_logs_key { '#', 'l' };

        uint8_vector account_key(const uint8_t prefix, const address_t &addr)
        {
            uint8_vector key {};
            key.reserve(1 + addr.size());
            key << prefix << addr;
            return key;
        }

        uint8_vector log_key(const uint64_t idx)
        {
            uint8_vector key {};
            key << log_prefix;
            // big-endian so that the storage order matches the emission order
            for (size_t i = 0; i < sizeof(idx); ++i)
                key << static_cast<uint8_t>(idx >> ((sizeof(idx) - 1 - i) * 8));
            return key;
        }

        uint8_vector read_code(const storage::db_t &db, const address_t &addr)
        {
            if (auto v = db.get(account_key(code_prefix, addr)); v)
                return std::move(*v);
            return {};
        }

        uint64_t read_uint(const storage::db_t &db, const buffer key)
        {
            if (const auto v = db.get(key); v)
                return codec::binary::from_bytes<uint64_t>(*v);
            return 0;
        }

        uint64_t read_nonce(const storage::db_t &db, const address_t &addr)
        {
            return read_uint(db, account_key(nonce_prefix, addr));
        }

        log_list_t read_logs(const storage::db_t &db)
        {
            const auto num_logs = read_uint(db, num_logs_key);
            log_list_t logs {};
            logs.reserve(num_logs);
            for (uint64_t i = 0; i < num_logs; ++i) {
                const auto v = db.get(log_key(i));
                if (!v) [[unlikely]]
                    throw error(fmt::format("ledger: the log entry #{} is missing", i));
                logs.emplace_back(codec::binary::from_bytes<log_t>(*v));
            }
            return logs;
        }
    }

    transaction_t::transaction_t(const config_t &cfg, storage::db_ptr_t db, const address_t &sender, const uint64_t gas_limit):
        _cfg { cfg },
        _db { std::move(db) },
        _sender { sender },
        _gas_limit { gas_limit }
    {
    }

    void transaction_t::charge(const uint64_t gas)
    {
        if (gas > _gas_limit - _gas_used) [[unlikely]]
            throw err_out_of_gas_t(fmt::format("out of gas: {} requested with {} of {} already used", gas, _gas_used, _gas_limit));
        _gas_used += gas;
    }

    uint8_vector transaction_t::code_at(const address_t &addr)
    {
        charge(_cfg.code_read_gas);
        return read_code(_db, addr);
    }

    uint64_t transaction_t::nonce_at(const address_t &addr) const
    {
        return read_nonce(_db, addr);
    }

    address_t transaction_t::create2(const address_t &deployer, const bytes32_t &salt, const buffer init_code)
    {
        charge(_cfg.create_gas);
        charge(_cfg.hash_word_gas * ((init_code.size() + 31) / 32));
        const auto addr = ledger::create2::address(deployer, salt, init_code);
        if (!read_code(_db, addr).empty() || read_nonce(_db, addr) != 0) [[unlikely]]
            throw err_address_collision_t(fmt::format("the address {} is already in use", addr));
        const auto runtime = ledger::create2::run_init_code(init_code);
        if (runtime.size() > _cfg.max_code_size) [[unlikely]]
            throw err_bad_init_code_t(fmt::format("the code size {} exceeds the limit of {} bytes", runtime.size(), _cfg.max_code_size));
        if (!runtime.empty() && runtime[0] == 0xEF) [[unlikely]]
            throw err_bad_init_code_t("code starting with the 0xEF byte cannot be deployed");
        charge(_cfg.code_deposit_gas * runtime.size());
        _db.set(account_key(code_prefix, addr), runtime);
        _db.set(account_key(nonce_prefix, addr), codec::binary::to_bytes(uint64_t { 1 }));
        _db.set(account_key(nonce_prefix, deployer), codec::binary::to_bytes(read_nonce(_db, deployer) + 1));
        logger::debug("ledger: {} deployed {} bytes of code at {}", deployer, runtime.size(), addr);
        return addr;
    }

    void transaction_t::emit(const log_t &log)
    {
        if (log.topics.size() > 4) [[unlikely]]
            throw error(fmt::format("a log may have at most four topics but got {}", log.topics.size()));
        charge(_cfg.log_gas + _cfg.log_topic_gas * log.topics.size() + _cfg.log_data_gas * log.data.size());
        const auto idx = read_uint(_db, num_logs_key);
        _db.set(log_key(idx), codec::binary::to_bytes(log));
        _db.set(num_logs_key, codec::binary::to_bytes(idx + 1));
    }

    void transaction_t::_commit()
    {
        logger::trace("ledger: transaction from {} committed {} updates using {} gas", _sender, _db.updates().size(), _gas_used);
        _db.commit();
    }

    ledger_t::ledger_t(storage::db_ptr_t db, const config_t &cfg):
        _cfg { cfg },
        _db { std::move(db) }
    {
        if (!_db) [[unlikely]]
            throw error("ledger: a storage backend is required");
    }

    uint8_vector ledger_t::code_at(const address_t &addr) const
    {
        std::scoped_lock lk { _mutex };
        std::scoped_lock db_lk { *_db };
        return read_code(*_db, addr);
    }

    uint64_t ledger_t::nonce_at(const address_t &addr) const
    {
        std::scoped_lock lk { _mutex };
        std::scoped_lock db_lk { *_db };
        return read_nonce(*_db, addr);
    }

    log_list_t ledger_t::logs() const
    {
        std::scoped_lock lk { _mutex };
        std::scoped_lock db_lk { *_db };
        return read_logs(*_db);
    }

    size_t ledger_t::num_logs() const
    {
        std::scoped_lock lk { _mutex };
        std::scoped_lock db_lk { *_db };
        return read_uint(*_db, num_logs_key);
    }

    snapshot_t ledger_t::snapshot() const
    {
        std::scoped_lock lk { _mutex };
        std::scoped_lock db_lk { *_db };
        std::map<address_t, account_state_t> accounts {};
        _db->foreach([&](const auto &k, const auto &v) {
            if (k.size() != 1 + address_t {}.size() || (k[0] != code_prefix && k[0] != nonce_prefix))
                return;
            const address_t addr { buffer { k }.subbuf(1) };
            auto &acc = accounts.try_emplace(addr).first->second;
            acc.address = addr;
            if (k[0] == code_prefix)
                acc.code.assign(v.begin(), v.end());
            else
                acc.nonce = codec::binary::from_bytes<uint64_t>(v);
        });
        snapshot_t snap {};
        snap.accounts.reserve(accounts.size());
        for (auto &&[addr, acc]: accounts)
            snap.accounts.emplace_back(std::move(acc));
        snap.logs = read_logs(*_db);
        return snap;
    }

    boost::json::value ledger_t::to_json() const
    {
        return codec::json::to_json(snapshot());
    }

    void ledger_t::restore(const snapshot_t &snap)
    {
        std::scoped_lock lk { _mutex };
        std::scoped_lock db_lk { *_db };
        storage::update::db_t upd { _db };
        _db->foreach([&](const auto &k, const auto &) {
            upd.erase(k);
        });
        for (const auto &acc: snap.accounts) {
            if (!acc.code.empty())
                upd.set(account_key(code_prefix, acc.address), acc.code);
            if (acc.nonce)
                upd.set(account_key(nonce_prefix, acc.address), codec::binary::to_bytes(acc.nonce));
        }
        for (size_t i = 0; i < snap.logs.size(); ++i)
            upd.set(log_key(i), codec::binary::to_bytes(snap.logs[i]));
        if (!snap.logs.empty())
            upd.set(num_logs_key, codec::binary::to_bytes(uint64_t { snap.logs.size() }));
        upd.commit();
        logger::info("ledger: restored {} accounts and {} logs", snap.accounts.size(), snap.logs.size());
    }

    void ledger_t::from_json(const boost::json::value &jv)
    {
        restore(codec::json::from_json<snapshot_t>(jv));
    }
}
