/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <tokenbind/common/test.hpp>
#include "keccak.hpp"

namespace {
    using namespace tokenbind;
    using namespace tokenbind::crypto;
    using namespace std::string_view_literals;
}

suite tokenbind_crypto_keccak_suite = [] {
    "tokenbind::crypto::keccak"_test = [] {
        "test vectors"_test = [] {
            using test_vector = std::pair<std::string_view, uint8_vector>;
            static std::vector test_vectors = {
                test_vector { "C5D2460186F7233C927E7DB2DCC703C0E500B653CA82273B7BFAD8045D85A470", uint8_vector::from_hex("") },
                test_vector { "6FFFA070B865BE3EE766DC2DB49B6AA55C369F7DE3703ADA2612D754145C01E6", uint8_vector::from_hex("AAFDC9243D3D4A096558A360CC27C8D862F0BE73DB5E88AA55") }
            };
            for (const auto &[exp_hex, input]: test_vectors) {
                const auto exp_hash = keccak::hash_t::from_hex(exp_hex);
                const auto hash = keccak::digest(input);
                expect_equal(exp_hash, hash);
            }
        };
        "function selectors"_test = [] {
            // the first four bytes of the hash of a canonical signature are well known
            const auto transfer = keccak::digest(buffer { "transfer(address,uint256)"sv });
            expect_equal(uint8_vector::from_hex("a9059cbb"), uint8_vector { static_cast<buffer>(transfer).subbuf(0, 4) });
            const auto supports = keccak::digest(buffer { "supportsInterface(bytes4)"sv });
            expect_equal(uint8_vector::from_hex("01ffc9a7"), uint8_vector { static_cast<buffer>(supports).subbuf(0, 4) });
        };
        "multi-part input"_test = [] {
            const auto whole = keccak::digest(uint8_vector::from_hex("AAFDC9243D3D4A096558A360CC27C8D862F0BE73DB5E88AA55"));
            const auto parts = keccak::digest({
                static_cast<buffer>(uint8_vector::from_hex("AAFDC9243D3D4A09")),
                static_cast<buffer>(uint8_vector::from_hex("6558A360CC27C8D862F0BE73DB5E88AA55"))
            });
            expect_equal(whole, parts);
        };
    };
};
