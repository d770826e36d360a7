/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/common/logger.hpp>
#include "update.hpp"

namespace tokenbind::storage::update {
    void db_t::commit()
    {
        logger::trace("storage::update::db: committing {} updates", _updates.size());
        _base_db->apply(_updates);
        reset();
    }

    void db_t::reset()
    {
        _updates.clear();
        _num_added = 0;
        _num_removed = 0;
    }

    void db_t::_set(const buffer key, value_t val)
    {
        logger::trace("storage::update::db: key #{} set to: {}", key, val ? fmt::format("{}", *val) : std::string { "<erased>" });
        const auto parent_val = _base_db->get(key);
        if (const auto it = _updates.find(key); it != _updates.end()) {
            if (it->second && !parent_val)
                --_num_added;
            else if (!it->second && parent_val)
                --_num_removed;
            _updates.erase(it);
        }
        if (parent_val == val)
            return;
        if (val && !parent_val)
            ++_num_added;
        else if (!val && parent_val)
            ++_num_removed;
        _updates.try_emplace(key, std::move(val));
    }
}
