/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/crypto/keccak.hpp>
#include "create2.hpp"
#include "errors.hpp"

namespace tokenbind::ledger::create2 {
    namespace {
        enum opcode_t: uint8_t {
            op_codecopy = 0x39,
            op_returndatasize = 0x3d,
            op_push1 = 0x60,
            op_dup1 = 0x80,
            op_dup2 = 0x81,
            op_return = 0xf3
        };
    }

    address_t address(const address_t &deployer, const bytes32_t &salt, const bytes32_t &code_hash)
    {
        static constexpr uint8_t prefix = 0xff;
        const auto h = crypto::keccak::digest({ buffer { &prefix, 1 }, deployer, salt, code_hash });
        return address_t { buffer { h }.subbuf(12) };
    }

    address_t address(const address_t &deployer, const bytes32_t &salt, const buffer init_code)
    {
        return address(deployer, salt, crypto::keccak::digest<bytes32_t>(init_code));
    }

    uint8_vector init_code(const buffer runtime_code)
    {
        if (runtime_code.size() > 0xFF) [[unlikely]]
            throw error(fmt::format("the runtime code of {} bytes does not fit a single-byte length", runtime_code.size()));
        uint8_vector res {};
        res.reserve(prologue_size + runtime_code.size());
        res << op_returndatasize << op_push1 << static_cast<uint8_t>(runtime_code.size())
            << op_dup1 << op_push1 << static_cast<uint8_t>(prologue_size)
            << op_returndatasize << op_codecopy << op_dup2 << op_return;
        res << runtime_code;
        return res;
    }

    uint8_vector run_init_code(const buffer init_code)
    {
        if (init_code.size() < prologue_size) [[unlikely]]
            throw err_bad_init_code_t(fmt::format("init code of {} bytes is too short for a constructor", init_code.size()));
        const auto at = [&](const size_t off) { return init_code[off]; };
        if (at(0) != op_returndatasize || at(1) != op_push1 || at(3) != op_dup1 || at(4) != op_push1
                || at(6) != op_returndatasize || at(7) != op_codecopy || at(8) != op_dup2 || at(9) != op_return) [[unlikely]]
            throw err_bad_init_code_t(fmt::format("unsupported constructor: {}", init_code.subbuf(0, prologue_size)));
        const size_t len = at(2);
        const size_t off = at(5);
        // CODECOPY zero-fills the bytes past the end of the code
        uint8_vector runtime(len);
        if (off < init_code.size()) {
            const auto avail = init_code.subbuf(off, std::min(len, init_code.size() - off));
            std::copy(avail.begin(), avail.end(), runtime.begin());
        }
        return runtime;
    }
}
