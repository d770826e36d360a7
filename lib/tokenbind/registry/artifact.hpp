#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <optional>
#include "binding.hpp"

// The deployed account code: a minimal delegate-forwarder to the implementation
// followed by the binding's immutable data record.
//
// | offset | size | content                                  |
// |--------|------|------------------------------------------|
// |      0 |   10 | header 363d3d373d3d3d363d73              |
// |     10 |   20 | implementation                           |
// |     30 |   15 | footer 5af43d82803e903d91602b57fd5bf3    |
// |     45 |   32 | salt                                     |
// |     77 |   32 | chain id, big-endian                     |
// |    109 |   32 | token contract, left-padded with zeros   |
// |    141 |   32 | token id, big-endian                     |
namespace tokenbind::registry::artifact {
    static constexpr size_t header_size = 10;
    static constexpr size_t implementation_offset = header_size;
    static constexpr size_t footer_offset = implementation_offset + 20;
    static constexpr size_t footer_size = 15;
    static constexpr size_t salt_offset = footer_offset + footer_size;
    static constexpr size_t chain_id_offset = salt_offset + 32;
    static constexpr size_t token_contract_offset = chain_id_offset + 32;
    static constexpr size_t token_id_offset = token_contract_offset + 32;
    static constexpr size_t runtime_size = token_id_offset + 32;
    static_assert(runtime_size == 173);

    extern const byte_array<header_size> &header();
    extern const byte_array<footer_size> &footer();

    [[nodiscard]] extern uint8_vector runtime_code(const binding_t &b);
    // The constructor prologue followed by the runtime code; the bytes whose hash determines the address.
    [[nodiscard]] extern uint8_vector init_code(const binding_t &b);
    // Recovers the binding from code of exactly this shape or returns an empty optional.
    [[nodiscard]] extern std::optional<binding_t> parse(buffer code);
}
