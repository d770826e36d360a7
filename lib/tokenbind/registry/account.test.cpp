/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/common/test.hpp>
#include <tokenbind/ledger/create2.hpp>
#include <tokenbind/storage/memory.hpp>
#include "account.hpp"
#include "artifact.hpp"
#include "registry.hpp"
#include "test-bindings.hpp"

namespace {
    using namespace tokenbind;
    using namespace tokenbind::registry;
    using namespace std::string_view_literals;

    const auto caller = address_t::from_hex("0x9999999999999999999999999999999999999999");
}

suite tokenbind_registry_account_suite = [] {
    "tokenbind::registry::account"_test = [] {
        "token round-trip"_test = [] {
            ledger::ledger_t l { std::make_shared<storage::memory::db_t>() };
            registry_t reg { test::registry_address(), l };
            auto b = test::sample_binding();
            b.chain_id = uint256_t::from_string("0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff01");
            b.token_id = uint256_t::from_string("115792089237316195423570985008687907853269984665640564039457584007913129639935");
            const account_t acc { reg.create(caller, b), l };
            expect(acc.token() == b.token());
            expect(acc.binding() == b);
        };
        "concrete scenario"_test = [] {
            ledger::ledger_t l { std::make_shared<storage::memory::db_t>() };
            registry_t reg { test::registry_address(), l };
            const auto x = reg.create(caller, test::sample_binding());
            const auto t = account_t { x, l }.token();
            expect_equal(uint256_t { 1 }, t.chain_id);
            expect_equal(address_t::from_hex("0x2222222222222222222222222222222222222222"), t.token_contract);
            expect_equal(uint256_t { 42 }, t.token_id);
        };
        "decoding the code directly"_test = [] {
            const auto code = artifact::runtime_code(test::sample_binding(7));
            expect(account_t::token(code) == test::sample_binding(7).token());
            expect(throws([&] { account_t::token(buffer { code }.subbuf(1)); }));
        };
        "non-accounts"_test = [] {
            ledger::ledger_t l { std::make_shared<storage::memory::db_t>() };
            expect(throws([&] { account_t { caller, l }.token(); }));
            const auto other = l.transact(caller, [&](ledger::transaction_t &tx) {
                return tx.create2(caller, bytes32_t {}, ledger::create2::init_code(uint8_vector::from_hex("0x363d3d37")));
            });
            expect(throws([&] { account_t { other, l }.token(); }));
            expect(throws([&] { account_t { other, l }.binding(); }));
        };
    };
};
