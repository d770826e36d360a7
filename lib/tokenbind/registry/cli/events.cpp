/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/codec/json.hpp>
#include <tokenbind/registry/registry.hpp>
#include "common.hpp"

namespace tokenbind::cli::registry::events {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "events";
            cmd.desc = "Print the account creation records of all registries as JSON";
            cmd.args.expect({ "[<registry>]" });
            add_ledger_option(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            required_option(opts, "ledger-dir");
            const ledger::ledger_t l { open_db(opts) };
            std::optional<address_t> filter {};
            if (!args.empty())
                filter = address_t::from_hex(args.at(0));
            boost::json::array res {};
            for (const auto &log: l.logs()) {
                if (filter && log.address != *filter)
                    continue;
                if (const auto ev = created_event_t::from_log(log); ev) {
                    auto jv = codec::json::to_json(*ev);
                    jv.as_object().emplace("registry", log.address.to_string());
                    res.emplace_back(std::move(jv));
                }
            }
            logger::debug("found {} creation records", res.size());
            codec::json::save_pretty(std::cout, res);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
