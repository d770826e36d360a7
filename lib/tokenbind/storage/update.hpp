#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <map>
#include "common.hpp"

namespace tokenbind::storage::update {
    // Buffers writes on top of a base db until commit.
    // N.B. this class is not thread safe!
    // N.B. this class assumes that the base_db is not modified while updates are pending
    struct db_t final: storage::db_t {
        using update_map_t = batch_t;

        db_t() = delete;
        db_t(const db_t &) = delete;

        explicit db_t(storage::db_ptr_t db):
            _base_db { std::move(db) }
        {
        }

        ~db_t() override = default;

        void clear() override
        {
            throw error("clear is not supported for update::db_t!");
        }

        void erase(const buffer key) override
        {
            _set(key, {});
        }

        void foreach(const observer_t &obs) const override
        {
            auto upd_it = _updates.begin();
            const auto upd_end = _updates.end();
            _base_db->foreach([&](const auto &k, const auto &v) {
                while (upd_it != upd_end && upd_it->first < k) {
                    if (upd_it->second)
                        obs(upd_it->first, *upd_it->second);
                    ++upd_it;
                }
                if (upd_it != upd_end && upd_it->first == k) {
                    if (upd_it->second)
                        obs(k, *upd_it->second);
                    ++upd_it;
                } else {
                    obs(k, v);
                }
            });
            for (; upd_it != upd_end; ++upd_it) {
                if (upd_it->second)
                    obs(upd_it->first, *upd_it->second);
            }
        }

        value_t get(const buffer k) const override
        {
            if (const auto it = _updates.find(k); it != _updates.end())
                return it->second;
            return _base_db->get(k);
        }

        void set(const buffer key, const buffer val) override
        {
            _set(key, uint8_vector { val });
        }

        [[nodiscard]] size_t size() const override
        {
            return _base_db->size() + _num_added - _num_removed;
        }

        // Hands all pending updates to the base db as a single batch.
        void commit();
        void reset();

        [[nodiscard]] const update_map_t &updates() const noexcept
        {
            return _updates;
        }
    private:
        storage::db_ptr_t _base_db;
        update_map_t _updates {};
        size_t _num_added = 0;
        size_t _num_removed = 0;

        void _set(buffer key, value_t val);
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
