#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <tokenbind/common/bytes.hpp>

namespace tokenbind::storage {
    using value_t = std::optional<uint8_vector>;
    using observer_t = std::function<void(uint8_vector, uint8_vector)>;
    // A set of writes applied together: an empty value erases the key.
    using batch_t = std::map<uint8_vector, value_t>;

    // An ordered key-value store; foreach visits the keys in ascending order.
    struct db_t {
        virtual ~db_t() = default;
        virtual void clear() = 0;
        virtual void erase(buffer key) = 0;
        virtual void foreach(const observer_t &) const = 0;
        [[nodiscard]] virtual value_t get(buffer key) const = 0;
        virtual void set(buffer key, buffer val) = 0;
        [[nodiscard]] virtual size_t size() const = 0;

        // Persistent stores apply the whole batch or, after a crash, complete it on the next lock.
        virtual void apply(const batch_t &batch)
        {
            for (const auto &[k, v]: batch) {
                if (v)
                    set(k, *v);
                else
                    erase(k);
            }
        }

        // Excludes other users of the same store, including other processes for persistent stores.
        // Stores shared only within a process rely on the callers' own synchronization.
        virtual void lock()
        {
        }

        virtual void unlock()
        {
        }

        [[nodiscard]] bool empty() const
        {
            return size() == 0;
        }

        [[nodiscard]] bool contains(const buffer key) const
        {
            return get(key).has_value();
        }
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
