#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <iostream>
#include <tokenbind/common/cli.hpp>
#include <tokenbind/ledger/ledger.hpp>
#include <tokenbind/storage/file.hpp>
#include <tokenbind/storage/memory.hpp>
#include <tokenbind/registry/binding.hpp>

namespace tokenbind::cli::registry {
    using namespace tokenbind::registry;

    // The five binding fields starting at the given argument position.
    inline binding_t binding_from_args(const arguments &args, const size_t first)
    {
        return binding_t::from_strings(args.at(first), args.at(first + 1), args.at(first + 2), args.at(first + 3), args.at(first + 4));
    }

    inline void add_ledger_option(config &cmd)
    {
        cmd.opts.try_emplace("ledger-dir", "a directory with the ledger state; a temporary in-memory ledger is used when missing");
    }

    inline const std::string &required_option(const options &opts, const std::string &name)
    {
        const auto it = opts.find(name);
        if (it == opts.end() || !it->second || it->second->empty()) [[unlikely]]
            throw error(fmt::format("the --{} option is required", name));
        return *it->second;
    }

    inline storage::db_ptr_t open_db(const options &opts)
    {
        if (const auto it = opts.find("ledger-dir"); it != opts.end() && it->second) {
            logger::debug("using the ledger at {}", *it->second);
            return std::make_shared<storage::file::db_t>(*it->second);
        }
        logger::debug("using a temporary in-memory ledger");
        return std::make_shared<storage::memory::db_t>();
    }
}
