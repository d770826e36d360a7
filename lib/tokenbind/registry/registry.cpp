/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/common/logger.hpp>
#include <tokenbind/ledger/abi.hpp>
#include "address.hpp"
#include "artifact.hpp"
#include "registry.hpp"

namespace tokenbind::registry {
    namespace {
        bool holds_address(const bytes32_t &w)
        {
            return buffer { w }.subbuf(0, 12).all_zero();
        }
    }

    const bytes32_t &created_event_t::signature()
    {
        static const auto sig = ledger::abi::event_topic("Created(address,address,bytes32,uint256,address,uint256)");
        return sig;
    }

    std::optional<created_event_t> created_event_t::from_log(const ledger::log_t &log)
    {
        if (log.topics.size() != 4 || log.topics[0] != signature() || log.data.size() != 3 * 32)
            return {};
        const auto account_word = ledger::abi::word_at(log.data, 0);
        if (!holds_address(log.topics[1]) || !holds_address(log.topics[2]) || !holds_address(account_word))
            return {};
        return created_event_t {
            ledger::abi::address_from_word(account_word),
            binding_t {
                ledger::abi::address_from_word(log.topics[1]),
                ledger::abi::word_at(log.data, 1),
                uint256_t::from_word(ledger::abi::word_at(log.data, 2)),
                ledger::abi::address_from_word(log.topics[2]),
                uint256_t::from_word(log.topics[3])
            }
        };
    }

    ledger::log_t created_event_t::to_log(const address_t &emitter) const
    {
        ledger::log_t log {};
        log.address = emitter;
        log.topics.reserve(4);
        log.topics.emplace_back(signature());
        log.topics.emplace_back(ledger::abi::word(binding.implementation));
        log.topics.emplace_back(ledger::abi::word(binding.token_contract));
        log.topics.emplace_back(ledger::abi::word(binding.token_id));
        log.data = ledger::abi::encode({ ledger::abi::word(account), binding.salt, ledger::abi::word(binding.chain_id) });
        return log;
    }

    const selector_t &registry_t::capability_id()
    {
        static const auto id = [] {
            const auto create_sel = ledger::abi::selector("create(address,bytes32,uint256,address,uint256)");
            const auto compute_sel = ledger::abi::selector("compute(address,bytes32,uint256,address,uint256)");
            selector_t res {};
            for (size_t i = 0; i < res.size(); ++i)
                res[i] = create_sel[i] ^ compute_sel[i];
            return res;
        }();
        return id;
    }

    const selector_t &registry_t::creation_failed_selector()
    {
        static const auto sel = ledger::abi::selector("CreationFailed()");
        return sel;
    }

    registry_t::registry_t(const address_t &addr, ledger::ledger_t &ledger):
        _addr { addr },
        _ledger { ledger }
    {
    }

    address_t registry_t::compute(const binding_t &b) const
    {
        return registry::address::compute(_addr, b);
    }

    bool registry_t::supports(const selector_t &interface_id)
    {
        return interface_id == capability_id();
    }

    address_t registry_t::create(ledger::transaction_t &tx, const binding_t &b) const
    {
        const auto target = compute(b);
        try {
            if (!tx.code_at(target).empty()) {
                logger::debug("registry {}: the account {} already exists", _addr, target);
                return target;
            }
            const auto deployed = tx.create2(_addr, b.salt, artifact::init_code(b));
            if (deployed != target) [[unlikely]]
                throw err_creation_failed_t(fmt::format("the ledger deployed the account at {} instead of {}", deployed, target));
            tx.emit(created_event_t { target, b }.to_log(_addr));
        } catch (const err_creation_failed_t &) {
            throw;
        } catch (const error &ex) {
            throw err_creation_failed_t(fmt::format("registry {}: the creation of the account {} failed", _addr, target), ex);
        }
        logger::info("registry {}: created the account {} for the token {} #{} on the chain {}",
            _addr, target, b.token_contract, b.token_id, b.chain_id);
        return target;
    }

    address_t registry_t::create(const address_t &sender, const binding_t &b, const std::optional<uint64_t> gas_limit)
    {
        try {
            return _ledger.transact(sender, gas_limit.value_or(_ledger.config().default_gas_limit), [&](ledger::transaction_t &tx) {
                return create(tx, b);
            });
        } catch (const err_creation_failed_t &ex) {
            logger::warn("{}", ex.what());
            throw;
        }
    }

    created_event_list_t registry_t::events() const
    {
        created_event_list_t res {};
        for (const auto &log: _ledger.logs()) {
            if (log.address != _addr)
                continue;
            if (auto ev = created_event_t::from_log(log); ev)
                res.emplace_back(std::move(*ev));
        }
        return res;
    }
}
