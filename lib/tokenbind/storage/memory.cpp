/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <map>
#include <tokenbind/common/logger.hpp>
#include "memory.hpp"

namespace tokenbind::storage::memory {
    struct db_t::impl {
        void clear()
        {
            logger::trace("storage::memory: dropping {} entries", _db.size());
            _db.clear();
        }

        void erase(const buffer key)
        {
            // the comparator is transparent so lookups by a buffer do not copy the key
            const auto it = _db.find(key);
            if (it == _db.end())
                return;
            logger::trace("storage::memory: erase {}", key);
            _db.erase(it);
        }

        void foreach(const observer_t &obs) const
        {
            for (const auto &[k, v]: _db)
                obs(k, v);
        }

        value_t get(const buffer key) const
        {
            const auto it = _db.find(key);
            if (it == _db.end())
                return {};
            return it->second;
        }

        void set(const buffer key, const buffer val)
        {
            logger::trace("storage::memory: set {} to {} bytes", key, val.size());
            if (const auto it = _db.find(key); it != _db.end()) {
                it->second = val;
                return;
            }
            _db.emplace(uint8_vector { key }, uint8_vector { val });
        }

        [[nodiscard]] size_t size() const
        {
            return _db.size();
        }
    private:
        std::map<uint8_vector, uint8_vector, std::less<>> _db {};
    };

    db_t::db_t():
        _impl { std::make_unique<impl>() }
    {
    }

    db_t::~db_t() = default;

    void db_t::clear()
    {
        _impl->clear();
    }

    size_t db_t::size() const
    {
        return _impl->size();
    }

    void db_t::erase(const buffer key)
    {
        _impl->erase(key);
    }

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    value_t db_t::get(const buffer key) const
    {
        return _impl->get(key);
    }

    void db_t::set(const buffer key, const buffer val)
    {
        _impl->set(key, val);
    }
}
