#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include "common.hpp"

namespace tokenbind::storage::memory {
    // Backs the unit tests and the ephemeral ledger of the command-line tool.
    struct db_t: storage::db_t {
        explicit db_t();
        ~db_t() override;
        void clear() override;
        void erase(buffer key) override;
        void foreach(const observer_t &) const override;
        value_t get(buffer key) const override;
        void set(buffer key, buffer val) override;
        [[nodiscard]] size_t size() const override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
