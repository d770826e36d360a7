#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <compare>
#include <boost/multiprecision/cpp_int.hpp>
#include <tokenbind/common/bytes.hpp>
#include <tokenbind/codec/json.hpp>
#include <tokenbind/codec/serializable.hpp>

namespace tokenbind::ledger {
    using namespace std::string_view_literals;

    // Fixed-width byte strings print and serialize as 0x-prefixed lower-case hex.
    template<size_t SZ>
    struct fixed_bytes_t: byte_array<SZ> {
        using base_type = byte_array<SZ>;
        using base_type::base_type;

        static fixed_bytes_t from_hex(const std::string_view hex)
        {
            return base_type::template from_hex<fixed_bytes_t>(hex);
        }

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(*this);
        }

        [[nodiscard]] std::string to_string() const
        {
            return fmt::format("0x{}", buffer_lowercase { base_type::data(), SZ });
        }

        bool operator==(const fixed_bytes_t &o) const = default;
        std::strong_ordering operator<=>(const fixed_bytes_t &o) const = default;
    };

    using address_t = fixed_bytes_t<20>;
    using bytes32_t = fixed_bytes_t<32>;
    using selector_t = fixed_bytes_t<4>;

    // An unsigned 256-bit integer; the EVM word type of chain ids and token ids.
    struct uint256_t {
        using value_type = boost::multiprecision::uint256_t;

        // Accepts a decimal number or a 0x-prefixed hexadecimal one.
        static uint256_t from_string(std::string_view str);
        // Big-endian 32-byte word.
        static uint256_t from_word(buffer word);
        static uint256_t from_json(const boost::json::value &jv);

        uint256_t() = default;

        uint256_t(const uint64_t v):
            _val { v }
        {
        }

        explicit uint256_t(value_type v):
            _val { std::move(v) }
        {
        }

        [[nodiscard]] const value_type &value() const noexcept
        {
            return _val;
        }

        [[nodiscard]] bytes32_t to_word() const;
        [[nodiscard]] std::string to_string() const;
        [[nodiscard]] boost::json::value to_json() const;

        void serialize(auto &archive)
        {
            auto word = to_word();
            archive.process_bytes_fixed(word);
            *this = from_word(word);
        }

        bool operator==(const uint256_t &o) const
        {
            return _val == o._val;
        }

        std::strong_ordering operator<=>(const uint256_t &o) const
        {
            if (_val < o._val)
                return std::strong_ordering::less;
            if (_val > o._val)
                return std::strong_ordering::greater;
            return std::strong_ordering::equal;
        }
    private:
        value_type _val {};
    };

    // An EVM-style event record.
    struct log_t {
        address_t address {};
        codec::sequence_t<bytes32_t> topics {};
        codec::byte_sequence_t data {};

        void serialize(auto &archive)
        {
            archive.process("address"sv, address);
            archive.process("topics"sv, topics);
            archive.process("data"sv, data);
        }

        bool operator==(const log_t &o) const = default;
    };
    using log_list_t = codec::sequence_t<log_t>;
}
