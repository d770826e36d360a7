/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/common/test.hpp>
#include "artifact.hpp"
#include "test-bindings.hpp"

namespace {
    using namespace tokenbind;
    using namespace tokenbind::registry;
    using namespace std::string_view_literals;
}

suite tokenbind_registry_artifact_suite = [] {
    "tokenbind::registry::artifact"_test = [] {
        "runtime code"_test = [] {
            const auto code = artifact::runtime_code(test::sample_binding());
            expect_equal(size_t { 173 }, code.size());
            expect_equal(uint8_vector::from_hex(
                "363d3d373d3d3d363d73"
                "1111111111111111111111111111111111111111"
                "5af43d82803e903d91602b57fd5bf3"
                "0000000000000000000000000000000000000000000000000000000000000000"
                "0000000000000000000000000000000000000000000000000000000000000001"
                "0000000000000000000000002222222222222222222222222222222222222222"
                "000000000000000000000000000000000000000000000000000000000000002a"), code);
        };
        "field offsets"_test = [] {
            auto b = test::sample_binding();
            b.salt = bytes32_t::from_hex(std::string(64, 'a'));
            b.chain_id = uint256_t::from_string("0x" + std::string(64, 'b'));
            b.token_contract = address_t::from_hex(std::string(40, 'c'));
            b.token_id = uint256_t::from_string("0x" + std::string(64, 'd'));
            const auto code = artifact::runtime_code(b);
            const buffer cb { code };
            expect_equal(buffer { artifact::header() }, cb.subbuf(0, 10));
            expect_equal(buffer { b.implementation }, cb.subbuf(10, 20));
            expect_equal(buffer { artifact::footer() }, cb.subbuf(30, 15));
            expect_equal(buffer { b.salt }, cb.subbuf(45, 32));
            expect_equal(buffer { b.chain_id.to_word() }, cb.subbuf(77, 32));
            expect(cb.subbuf(109, 12).all_zero());
            expect_equal(buffer { b.token_contract }, cb.subbuf(121, 20));
            expect_equal(buffer { b.token_id.to_word() }, cb.subbuf(141, 32));
        };
        "init code"_test = [] {
            const auto b = test::sample_binding();
            const auto init = artifact::init_code(b);
            expect_equal(size_t { 183 }, init.size());
            expect_equal(uint8_vector::from_hex("3d60ad80600a3d3981f3"), uint8_vector { buffer { init }.subbuf(0, 10) });
            expect_equal(artifact::runtime_code(b), uint8_vector { buffer { init }.subbuf(10) });
        };
        "parse"_test = [] {
            const auto b = test::sample_binding(43);
            const auto code = artifact::runtime_code(b);
            const auto parsed = artifact::parse(code);
            expect(parsed.has_value());
            expect(parsed && *parsed == b);
            expect(!artifact::parse(uint8_vector { buffer { code }.subbuf(0, 172) }).has_value());
            expect(!artifact::parse(artifact::init_code(b)).has_value());
            auto bad_header = code;
            bad_header[0] = 0x00;
            expect(!artifact::parse(bad_header).has_value());
            auto bad_footer = code;
            bad_footer[44] = 0x00;
            expect(!artifact::parse(bad_footer).has_value());
            auto bad_padding = code;
            bad_padding[109] = 0x01;
            expect(!artifact::parse(bad_padding).has_value());
        };
    };
};
