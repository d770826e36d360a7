#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <tokenbind/common/bytes.hpp>

namespace tokenbind::crypto::keccak {
    // The original Keccak-256 padding (0x01), not the FIPS-202 SHA3-256 one (0x06).
    using hash_t = byte_array<32>;

    extern void digest(hash_t &out, const buffer &in);
    extern void digest(hash_t &out, std::initializer_list<buffer> parts);

    template<typename T=hash_t>
    T digest(const buffer &in)
    {
        T out;
        digest(out, in);
        return out;
    }

    template<typename T=hash_t>
    T digest(const std::initializer_list<buffer> parts)
    {
        T out;
        digest(out, parts);
        return out;
    }
}
