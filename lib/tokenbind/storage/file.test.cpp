/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>
#include <tokenbind/common/test.hpp>
#include "file.hpp"

namespace {
    using namespace tokenbind;
    using namespace tokenbind::storage;
    using namespace std::string_view_literals;
}

suite tokenbind_storage_file_suite = [] {
    "tokenbind::storage::file"_test = [] {
        "get, set, and erase"_test = [] {
            const tokenbind::file::tmp_directory tmp_dir { "test-tokenbind-filedb" };
            storage::file::db_t db { tmp_dir.path() };
            expect_equal(value_t {}, db.get("AB"sv));
            expect(throws([&] { db.set(""sv, ""sv); }));
            expect(throws([&] { db.set("A"sv, ""sv); }));
            db.set("AB"sv, "CD"sv);
            expect_equal(value_t { "CD"sv }, db.get("AB"sv));
            db.set("AB"sv, "EF"sv);
            expect_equal(value_t { "EF"sv }, db.get("AB"sv));
            expect_equal(size_t { 1 }, db.size());
            db.erase("AB"sv);
            expect_equal(value_t {}, db.get("AB"sv));
            expect_equal(size_t { 0 }, db.size());
        };
        "foreach"_test = [] {
            const tokenbind::file::tmp_directory tmp_dir { "test-tokenbind-filedb" };
            storage::file::db_t client { tmp_dir.path() };
            std::map<uint8_vector, uint8_vector> exp {};
            exp.try_emplace(uint8_vector::from_hex("CCDD"), uint8_vector::from_hex("2233"));
            exp.try_emplace(uint8_vector::from_hex("AABB"), uint8_vector::from_hex("0011"));
            exp.try_emplace(uint8_vector::from_hex("AA00"), uint8_vector {});
            for (const auto &[k, v]: exp)
                client.set(k, v);
            std::vector<uint8_vector> keys {};
            std::map<uint8_vector, uint8_vector> act {};
            client.foreach([&](auto &&k, auto &&v) {
                keys.emplace_back(k);
                act.try_emplace(std::move(k), std::move(v));
            });
            expect(exp == act);
            expect(std::is_sorted(keys.begin(), keys.end()));
        };
        "reopen"_test = [] {
            const tokenbind::file::tmp_directory tmp_dir { "test-tokenbind-filedb" };
            {
                storage::file::db_t db { tmp_dir.path() };
                db.set("AB"sv, "CD"sv);
                db.set("XY"sv, "EF"sv);
            }
            storage::file::db_t db { tmp_dir.path() };
            expect_equal(size_t { 2 }, db.size());
            expect_equal(value_t { "EF"sv }, db.get("XY"sv));
            db.clear();
            expect(db.empty());
            expect_equal(value_t {}, db.get("AB"sv));
        };
        "apply"_test = [] {
            const tokenbind::file::tmp_directory tmp_dir { "test-tokenbind-filedb" };
            storage::file::db_t db { tmp_dir.path() };
            db.set("AB"sv, "CD"sv);
            batch_t batch {};
            batch.try_emplace(uint8_vector { "AB"sv }, value_t {});
            batch.try_emplace(uint8_vector { "XY"sv }, value_t { "EF"sv });
            {
                const std::scoped_lock lk { db };
                db.apply(batch);
            }
            expect_equal(value_t {}, db.get("AB"sv));
            expect_equal(value_t { "EF"sv }, db.get("XY"sv));
            expect_equal(size_t { 1 }, db.size());
            expect(!std::filesystem::exists(tmp_dir.path() / storage::file::journal_name));
        };
        "journal encoding"_test = [] {
            batch_t batch {};
            batch.try_emplace(uint8_vector::from_hex("6C0000000000000001"), value_t { uint8_vector::from_hex("00FF") });
            batch.try_emplace(uint8_vector::from_hex("236C"), value_t {});
            batch.try_emplace(uint8_vector::from_hex("6300"), value_t { uint8_vector {} });
            const auto decoded = storage::file::journal::decode(storage::file::journal::encode(batch));
            expect(batch == decoded);
            auto bytes = storage::file::journal::encode(batch);
            bytes.emplace_back(0);
            expect(throws([&] { storage::file::journal::decode(bytes); }));
        };
        "an interrupted batch is completed by the next lock"_test = [] {
            const tokenbind::file::tmp_directory tmp_dir { "test-tokenbind-filedb" };
            batch_t batch {};
            batch.try_emplace(uint8_vector { "#l"sv }, value_t { "01"sv });
            batch.try_emplace(uint8_vector { "l0"sv }, value_t { "log"sv });
            batch.try_emplace(uint8_vector { "old"sv }, value_t {});
            {
                storage::file::db_t db { tmp_dir.path() };
                db.set("old"sv, "value"sv);
                // the state of a writer that stopped after the counter but before the entry it counts
                db.set("#l"sv, "01"sv);
                tokenbind::file::write((tmp_dir.path() / storage::file::journal_name).string(), storage::file::journal::encode(batch));
            }
            storage::file::db_t db { tmp_dir.path() };
            expect_equal(value_t {}, db.get("l0"sv));
            {
                const std::scoped_lock lk { db };
                expect_equal(value_t { "log"sv }, db.get("l0"sv));
                expect_equal(value_t { "01"sv }, db.get("#l"sv));
                expect_equal(value_t {}, db.get("old"sv));
            }
            expect(!std::filesystem::exists(tmp_dir.path() / storage::file::journal_name));
            expect_equal(size_t { 2 }, db.size());
        };
        "instances on the same directory share the lock"_test = [] {
            const tokenbind::file::tmp_directory tmp_dir { "test-tokenbind-filedb" };
            storage::file::db_t db1 { tmp_dir.path() };
            storage::file::db_t db2 { tmp_dir.path() };
            std::atomic_bool db2_locked { false };
            std::unique_lock lk1 { db1 };
            std::thread t { [&] {
                const std::scoped_lock lk2 { db2 };
                db2_locked = true;
            } };
            std::this_thread::sleep_for(std::chrono::milliseconds { 50 });
            expect(!db2_locked.load());
            lk1.unlock();
            t.join();
            expect(db2_locked.load());
        };
    };
};
