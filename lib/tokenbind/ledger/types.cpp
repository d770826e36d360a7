/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <limits>
#include "types.hpp"

namespace tokenbind::ledger {
    uint256_t uint256_t::from_string(const std::string_view str)
    {
        const auto digits = strip_hex_prefix(str);
        const unsigned base = digits.size() == str.size() ? 10 : 16;
        if (digits.empty()) [[unlikely]]
            throw error(fmt::format("an unsigned 256-bit integer expected but got: '{}'", str));
        boost::multiprecision::cpp_int v = 0;
        for (const char c: digits) {
            unsigned d;
            if (base == 16) {
                d = uint_from_hex(c);
            } else {
                if (c < '0' || c > '9') [[unlikely]]
                    throw error(fmt::format("unexpected character in a decimal number: '{}'", str));
                d = static_cast<unsigned>(c - '0');
            }
            v = v * base + d;
        }
        if (v > boost::multiprecision::cpp_int { std::numeric_limits<value_type>::max() }) [[unlikely]]
            throw error(fmt::format("the value does not fit into 256 bits: {}", str));
        return uint256_t { static_cast<value_type>(v) };
    }

    uint256_t uint256_t::from_word(const buffer word)
    {
        if (word.size() != 32) [[unlikely]]
            throw error(fmt::format("a 256-bit word must have 32 bytes but got {}", word.size()));
        value_type v = 0;
        for (const auto b: word) {
            v <<= 8;
            v |= b;
        }
        return uint256_t { std::move(v) };
    }

    uint256_t uint256_t::from_json(const boost::json::value &jv)
    {
        if (jv.is_string())
            return from_string(jv.get_string());
        return uint256_t { boost::json::value_to<uint64_t>(jv) };
    }

    bytes32_t uint256_t::to_word() const
    {
        bytes32_t w {};
        value_type v = _val;
        for (size_t i = 0; i < w.size(); ++i) {
            const value_type low = v & 0xFF;
            w[w.size() - 1 - i] = low.convert_to<uint8_t>();
            v >>= 8;
        }
        return w;
    }

    std::string uint256_t::to_string() const
    {
        return _val.str();
    }

    boost::json::value uint256_t::to_json() const
    {
        return boost::json::string { to_string() };
    }
}
