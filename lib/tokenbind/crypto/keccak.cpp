/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <hash-library/keccak.h>
#include "keccak.hpp"

namespace tokenbind::crypto::keccak {
    static void finish(hash_t &out, Keccak &hasher)
    {
        // getHash returns lower-case hex; the binary form is not a part of the upstream API
        init_from_hex(out, hasher.getHash());
    }

    void digest(hash_t &out, const buffer &in)
    {
        Keccak hasher { Keccak::Keccak256 };
        hasher.add(in.data(), in.size());
        finish(out, hasher);
    }

    void digest(hash_t &out, const std::initializer_list<buffer> parts)
    {
        Keccak hasher { Keccak::Keccak256 };
        for (const auto &p: parts)
            hasher.add(p.data(), p.size());
        finish(out, hasher);
    }
}
