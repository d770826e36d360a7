/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/codec/json.hpp>
#include <tokenbind/registry/account.hpp>
#include "common.hpp"

namespace tokenbind::cli::registry::token {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "token";
            cmd.desc = "Print the token an account is bound to as JSON";
            cmd.args.expect({ "<account>" });
            add_ledger_option(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            required_option(opts, "ledger-dir");
            const ledger::ledger_t l { open_db(opts) };
            const account_t acc { address_t::from_hex(args.at(0)), l };
            codec::json::save_pretty(std::cout, codec::json::to_json(acc.token()));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
