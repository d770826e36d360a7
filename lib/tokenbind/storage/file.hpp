#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <string_view>
#include "common.hpp"

namespace tokenbind::storage::file {
    // The batch being applied is kept in this file inside the db directory until it is fully written.
    static constexpr std::string_view journal_name { "commit.journal" };
    // Holders of the advisory lock on this file have exclusive access to the db directory.
    static constexpr std::string_view lock_name { "db.lock" };

    namespace journal {
        extern uint8_vector encode(const batch_t &batch);
        extern batch_t decode(buffer bytes);
    }

    struct db_t: storage::db_t {
        explicit db_t(const std::string &dir_path);
        ~db_t() override;
        void clear() override;
        void erase(buffer key) override;
        void foreach(const observer_t &) const override;
        value_t get(buffer key) const override;
        void set(buffer key, buffer val) override;
        [[nodiscard]] size_t size() const override;
        void apply(const batch_t &batch) override;
        // Also completes a batch left unfinished by a crashed writer.
        void lock() override;
        void unlock() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
