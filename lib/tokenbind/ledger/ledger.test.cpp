/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <atomic>
#include <thread>
#include <tokenbind/common/test.hpp>
#include <tokenbind/storage/file.hpp>
#include <tokenbind/storage/memory.hpp>
#include "create2.hpp"
#include "ledger.hpp"

namespace {
    using namespace tokenbind;
    using namespace tokenbind::ledger;
    using namespace std::string_view_literals;

    const auto sender = address_t::from_hex("0x9999999999999999999999999999999999999999");
    const auto deployer = address_t::from_hex("0x3333333333333333333333333333333333333333");
    const auto runtime = uint8_vector::from_hex("0x363d3d37");
    const auto init = create2::init_code(runtime);

    bytes32_t salt_of(const uint64_t n)
    {
        return uint256_t { n }.to_word();
    }
}

suite tokenbind_ledger_suite = [] {
    "tokenbind::ledger"_test = [] {
        "deployment"_test = [] {
            ledger_t l { std::make_shared<storage::memory::db_t>() };
            const auto exp_addr = create2::address(deployer, salt_of(0), init);
            const auto [addr, gas] = l.transact(sender, [&](transaction_t &tx) {
                expect_equal(sender, tx.sender());
                const auto a = tx.create2(deployer, salt_of(0), init);
                expect_equal(runtime, tx.code_at(a));
                return std::make_pair(a, tx.gas_used());
            });
            expect_equal(exp_addr, addr);
            // create, one hashed word, four deposited bytes and one code read
            expect_equal(uint64_t { 32000 + 6 + 4 * 200 + 2600 }, gas);
            expect_equal(runtime, l.code_at(addr));
            expect_equal(uint64_t { 1 }, l.nonce_at(addr));
            expect_equal(uint64_t { 1 }, l.nonce_at(deployer));
            expect(l.code_at(sender).empty());
        };
        "collisions are rejected"_test = [] {
            ledger_t l { std::make_shared<storage::memory::db_t>() };
            l.transact(sender, [&](transaction_t &tx) {
                tx.create2(deployer, salt_of(1), init);
            });
            const auto before = l.snapshot();
            expect(throws<err_address_collision_t>([&] {
                l.transact(sender, [&](transaction_t &tx) {
                    tx.create2(deployer, salt_of(1), init);
                });
            }));
            expect(before == l.snapshot());
        };
        "failed transactions leave no trace"_test = [] {
            ledger_t l { std::make_shared<storage::memory::db_t>() };
            expect(throws([&] {
                l.transact(sender, [&](transaction_t &tx) {
                    tx.create2(deployer, salt_of(2), init);
                    tx.emit(log_t { deployer, {}, {} });
                    throw error("abort");
                });
            }));
            expect(l.code_at(create2::address(deployer, salt_of(2), init)).empty());
            expect_equal(size_t { 0 }, l.num_logs());
            expect_equal(uint64_t { 0 }, l.nonce_at(deployer));
            expect(l.snapshot().accounts.empty());
        };
        "out of gas"_test = [] {
            ledger_t l { std::make_shared<storage::memory::db_t>() };
            expect(throws<err_out_of_gas_t>([&] {
                l.transact(sender, 32005, [&](transaction_t &tx) {
                    tx.create2(deployer, salt_of(3), init);
                });
            }));
            expect(l.code_at(create2::address(deployer, salt_of(3), init)).empty());
            const auto addr = l.transact(sender, 32806, [&](transaction_t &tx) {
                return tx.create2(deployer, salt_of(3), init);
            });
            expect_equal(runtime, l.code_at(addr));
        };
        "custom gas schedule"_test = [] {
            config_t cfg {};
            cfg.create_gas = 1;
            cfg.code_deposit_gas = 0;
            cfg.hash_word_gas = 0;
            cfg.default_gas_limit = 1;
            ledger_t l { std::make_shared<storage::memory::db_t>(), cfg };
            expect_equal(uint64_t { 1 }, l.config().default_gas_limit);
            const auto gas = l.transact(sender, [&](transaction_t &tx) {
                tx.create2(deployer, salt_of(4), init);
                return tx.gas_used();
            });
            expect_equal(uint64_t { 1 }, gas);
        };
        "unsupported code"_test = [] {
            config_t cfg {};
            cfg.max_code_size = 3;
            ledger_t l { std::make_shared<storage::memory::db_t>(), cfg };
            expect(throws<err_bad_init_code_t>([&] {
                l.transact(sender, [&](transaction_t &tx) {
                    tx.create2(deployer, salt_of(5), init);
                });
            }));
            expect(throws<err_bad_init_code_t>([&] {
                l.transact(sender, [&](transaction_t &tx) {
                    tx.create2(deployer, salt_of(5), create2::init_code(uint8_vector::from_hex("0xEF00")));
                });
            }));
            expect(throws<err_bad_init_code_t>([&] {
                l.transact(sender, [&](transaction_t &tx) {
                    tx.create2(deployer, salt_of(5), runtime);
                });
            }));
        };
        "logs"_test = [] {
            ledger_t l { std::make_shared<storage::memory::db_t>() };
            log_t log {};
            log.address = deployer;
            log.topics.emplace_back(salt_of(7));
            log.data = uint8_vector::from_hex<codec::byte_sequence_t>("0xABCD");
            const auto gas = l.transact(sender, [&](transaction_t &tx) {
                tx.emit(log);
                tx.emit(log);
                return tx.gas_used();
            });
            expect_equal(uint64_t { 2 * (375 + 375 + 2 * 8) }, gas);
            const auto logs = l.logs();
            expect_equal(size_t { 2 }, logs.size());
            expect(logs.at(0) == log);
            expect(logs.at(1) == log);
            log.topics.resize(5);
            expect(throws([&] {
                l.transact(sender, [&](transaction_t &tx) {
                    tx.emit(log);
                });
            }));
            expect_equal(size_t { 2 }, l.num_logs());
        };
        "json snapshots"_test = [] {
            ledger_t src { std::make_shared<storage::memory::db_t>() };
            src.transact(sender, [&](transaction_t &tx) {
                tx.create2(deployer, salt_of(8), init);
                tx.emit(log_t { deployer, {}, {} });
            });
            const auto jv = src.to_json();
            const tokenbind::file::tmp_directory tmp_dir { "test-tokenbind-ledger" };
            ledger_t dst { std::make_shared<storage::file::db_t>(tmp_dir.path()) };
            dst.from_json(jv);
            expect(src.snapshot() == dst.snapshot());
            expect_equal(size_t { 2 }, dst.snapshot().accounts.size());
            expect_equal(runtime, dst.code_at(create2::address(deployer, salt_of(8), init)));
        };
        "transactions are serialized"_test = [] {
            ledger_t l { std::make_shared<storage::memory::db_t>() };
            static constexpr size_t num_threads = 8;
            std::atomic_size_t num_deployed { 0 };
            std::atomic_size_t num_collisions { 0 };
            std::vector<std::thread> threads {};
            for (size_t i = 0; i < num_threads; ++i) {
                threads.emplace_back([&, i] {
                    try {
                        l.transact(sender, [&](transaction_t &tx) {
                            tx.create2(deployer, salt_of(9), init);
                            tx.create2(deployer, salt_of(100 + i), init);
                        });
                        ++num_deployed;
                    } catch (const err_address_collision_t &) {
                        ++num_collisions;
                    }
                });
            }
            for (auto &t: threads)
                t.join();
            expect_equal(size_t { 1 }, num_deployed.load());
            expect_equal(num_threads - 1, num_collisions.load());
            expect_equal(uint64_t { 2 }, l.nonce_at(deployer));
            expect_equal(size_t { 3 }, l.snapshot().accounts.size());
        };
        "ledgers sharing a directory"_test = [] {
            const tokenbind::file::tmp_directory tmp_dir { "test-tokenbind-ledger" };
            ledger_t l1 { std::make_shared<storage::file::db_t>(tmp_dir.path()) };
            ledger_t l2 { std::make_shared<storage::file::db_t>(tmp_dir.path()) };
            static constexpr size_t num_txs = 16;
            std::atomic_size_t num_collisions { 0 };
            const auto run = [&](ledger_t &l, const uint64_t salt_base) {
                for (size_t i = 0; i < num_txs; ++i) {
                    try {
                        l.transact(sender, [&](transaction_t &tx) {
                            tx.emit(log_t { deployer, {}, {} });
                            tx.create2(deployer, salt_of(salt_base + i), init);
                            tx.create2(deployer, salt_of(i), init);
                        });
                    } catch (const err_address_collision_t &) {
                        ++num_collisions;
                    }
                }
            };
            std::thread t1 { [&] { run(l1, 1000); } };
            std::thread t2 { [&] { run(l2, 2000); } };
            t1.join();
            t2.join();
            // Each shared salt is deployed by exactly one of the ledgers.
            expect_equal(num_txs, num_collisions.load());
            const ledger_t fresh { std::make_shared<storage::file::db_t>(tmp_dir.path()) };
            expect_equal(uint64_t { 2 * num_txs }, fresh.nonce_at(deployer));
            expect_equal(size_t { num_txs }, fresh.num_logs());
            expect_equal(size_t { num_txs }, fresh.logs().size());
            for (size_t i = 0; i < num_txs; ++i) {
                expect(!fresh.code_at(create2::address(deployer, salt_of(i), init)).empty());
                const auto own1 = fresh.code_at(create2::address(deployer, salt_of(1000 + i), init));
                const auto own2 = fresh.code_at(create2::address(deployer, salt_of(2000 + i), init));
                expect(own1.empty() != own2.empty());
            }
            expect(l1.snapshot() == l2.snapshot());
        };
    };
};
