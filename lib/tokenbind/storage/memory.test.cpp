/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <tokenbind/common/test.hpp>
#include "memory.hpp"

namespace {
    using namespace tokenbind;
    using namespace tokenbind::storage;
    using namespace std::string_view_literals;

    std::map<uint8_vector, uint8_vector> get_contents(const storage::db_t &db)
    {
        std::map<uint8_vector, uint8_vector> act {};
        db.foreach([&](auto &&k, auto &&v) {
            act.try_emplace(std::move(k), std::move(v));
        });
        return act;
    }
}

suite tokenbind_storage_memory_suite = [] {
    "tokenbind::storage::memory"_test = [] {
        "get, set, and erase"_test = [] {
            memory::db_t db {};
            expect_equal(value_t {}, db.get("AB"sv));
            expect(!db.contains("AB"sv));
            db.set("AB"sv, "CD"sv);
            expect_equal(value_t { "CD"sv }, db.get("AB"sv));
            db.set("AB"sv, "EF"sv);
            expect_equal(value_t { "EF"sv }, db.get("AB"sv));
            expect_equal(size_t { 1 }, db.size());
            db.erase("AB"sv);
            expect_equal(value_t {}, db.get("AB"sv));
            expect(db.empty());
            db.erase("AB"sv);
            expect(db.empty());
        };
        "foreach is ordered"_test = [] {
            memory::db_t db {};
            db.set(uint8_vector::from_hex("CCDD"), uint8_vector::from_hex("2233"));
            db.set(uint8_vector::from_hex("AABB"), uint8_vector::from_hex("0011"));
            std::vector<uint8_vector> keys {};
            db.foreach([&](auto &&k, auto &&) {
                keys.emplace_back(std::move(k));
            });
            expect_equal(size_t { 2 }, keys.size());
            expect(keys.at(0) < keys.at(1));
            const std::map<uint8_vector, uint8_vector> exp {
                { uint8_vector::from_hex("AABB"), uint8_vector::from_hex("0011") },
                { uint8_vector::from_hex("CCDD"), uint8_vector::from_hex("2233") }
            };
            expect(exp == get_contents(db));
        };
        "clear"_test = [] {
            memory::db_t db {};
            db.set("AB"sv, "CD"sv);
            db.set("AC"sv, "CD"sv);
            db.clear();
            expect(db.empty());
            expect_equal(value_t {}, db.get("AC"sv));
        };
    };
};
