/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/crypto/keccak.hpp>
#include "abi.hpp"

namespace tokenbind::ledger::abi {
    selector_t selector(const std::string_view signature)
    {
        const auto h = crypto::keccak::digest(signature);
        return selector_t { buffer { h }.subbuf(0, 4) };
    }

    bytes32_t event_topic(const std::string_view signature)
    {
        return crypto::keccak::digest<bytes32_t>(signature);
    }

    bytes32_t word(const address_t &addr)
    {
        bytes32_t w {};
        std::copy(addr.begin(), addr.end(), w.begin() + (w.size() - addr.size()));
        return w;
    }

    bytes32_t word(const uint256_t &val)
    {
        return val.to_word();
    }

    address_t address_from_word(const bytes32_t &w)
    {
        const buffer wb { w };
        if (!wb.subbuf(0, 12).all_zero()) [[unlikely]]
            throw error(fmt::format("the word {} does not hold an address", w));
        return address_t { wb.subbuf(12) };
    }

    uint8_vector encode(const std::initializer_list<bytes32_t> words)
    {
        uint8_vector res {};
        res.reserve(words.size() * 32);
        for (const auto &w: words)
            res << buffer { w };
        return res;
    }

    bytes32_t word_at(const buffer data, const size_t idx)
    {
        return bytes32_t { data.subbuf(idx * 32, 32) };
    }
}
