/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/common/test.hpp>
#include "create2.hpp"
#include "errors.hpp"

namespace {
    using namespace tokenbind;
    using namespace tokenbind::ledger;
    using namespace std::string_view_literals;
}

suite tokenbind_ledger_create2_suite = [] {
    "tokenbind::ledger::create2"_test = [] {
        "reference vectors"_test = [] {
            struct test_vector {
                std::string_view deployer;
                std::string_view salt;
                std::string_view init_code;
                std::string_view address;
            };
            static const std::vector<test_vector> test_vectors {
                { "0x0000000000000000000000000000000000000000", "0x0000000000000000000000000000000000000000000000000000000000000000",
                    "0x00", "0x4d1a2e2bb4f88f0250f26ffff098b0b30b26bf38" },
                { "0xdeadbeef00000000000000000000000000000000", "0x0000000000000000000000000000000000000000000000000000000000000000",
                    "0x00", "0xb928f69bb1d91cd65274e3c79d8986362984fda3" },
                { "0xdeadbeef00000000000000000000000000000000", "0x000000000000000000000000feed000000000000000000000000000000000000",
                    "0x00", "0xd04116cdd17bebe565eb2422f2497e06cc1c9833" },
                { "0x0000000000000000000000000000000000000000", "0x0000000000000000000000000000000000000000000000000000000000000000",
                    "0xdeadbeef", "0x70f2b2914a2a4b783faefb75f459a580616fcb5e" },
                { "0x00000000000000000000000000000000deadbeef", "0x00000000000000000000000000000000000000000000000000000000cafebabe",
                    "0xdeadbeef", "0x60f3f640a8508fc6a86d45df051962668e1e8ac7" },
                { "0x00000000000000000000000000000000deadbeef", "0x00000000000000000000000000000000000000000000000000000000cafebabe",
                    "0xdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeefdeadbeef",
                    "0x1d8bfdc5d46dc4f61d6b6115972536ebe6a8854c" },
                { "0x0000000000000000000000000000000000000000", "0x0000000000000000000000000000000000000000000000000000000000000000",
                    "0x", "0xe33c0c7f7df4809055c3eba6c09cfe4baf1bd9e0" }
            };
            for (const auto &tv: test_vectors) {
                const auto addr = create2::address(address_t::from_hex(tv.deployer), bytes32_t::from_hex(tv.salt), uint8_vector::from_hex(tv.init_code));
                expect_equal(address_t::from_hex(tv.address), addr, tv.init_code);
            }
        };
        "copy-and-return constructor"_test = [] {
            const auto runtime = uint8_vector::from_hex("0x363d3d37");
            const auto init = create2::init_code(runtime);
            expect_equal(uint8_vector::from_hex("0x3d600480600a3d3981f3363d3d37"), init);
            expect_equal(runtime, create2::run_init_code(init));
        };
        "constructor reading past the end zero-fills"_test = [] {
            const auto runtime = create2::run_init_code(uint8_vector::from_hex("0x3d600480600a3d3981f3AABB"));
            expect_equal(uint8_vector::from_hex("0xAABB0000"), runtime);
        };
        "other constructors are rejected"_test = [] {
            expect(throws<err_bad_init_code_t>([] { create2::run_init_code(uint8_vector::from_hex("0x00")); }));
            expect(throws<err_bad_init_code_t>([] { create2::run_init_code(uint8_vector::from_hex("0x3d600480600a3d3981f0AABBCCDD")); }));
            expect(throws<err_bad_init_code_t>([] { create2::run_init_code(uint8_vector::from_hex("0x6080604052348015600f57600080fd")); }));
            expect(throws([] { create2::init_code(uint8_vector(256)); }));
        };
    };
};
