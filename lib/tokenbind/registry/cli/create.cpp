/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/registry/registry.hpp>
#include "common.hpp"

namespace tokenbind::cli::registry::create {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "create";
            cmd.desc = "Deploy the account of a binding unless it exists and print its address";
            cmd.args.expect({ "<registry>", "<implementation>", "<salt>", "<chain-id>", "<token-contract>", "<token-id>" });
            add_ledger_option(cmd);
            cmd.opts.try_emplace("gas-limit", "the gas limit of the transaction");
            cmd.opts.try_emplace("sender", "the address submitting the transaction",
                "0x0000000000000000000000000000000000000000");
        }

        void run(const arguments &args, const options &opts) const override
        {
            ledger::ledger_t l { open_db(opts) };
            registry_t reg { address_t::from_hex(args.at(0)), l };
            const auto b = binding_from_args(args, 1);
            std::optional<uint64_t> gas_limit {};
            if (const auto it = opts.find("gas-limit"); it != opts.end() && it->second)
                gas_limit = from_str<uint64_t>(*it->second);
            const auto sender = address_t::from_hex(required_option(opts, "sender"));
            const auto num_events = reg.events().size();
            const auto addr = reg.create(sender, b, gas_limit);
            if (reg.events().size() == num_events)
                logger::info("the account {} already exists", addr);
            std::cout << fmt::format("{}\n", addr);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
