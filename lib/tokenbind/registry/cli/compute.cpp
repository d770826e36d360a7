/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/registry/address.hpp>
#include "common.hpp"

namespace tokenbind::cli::registry::compute {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "compute";
            cmd.desc = "Print the address of the account of a binding without deploying it";
            cmd.args.expect({ "<registry>", "<implementation>", "<salt>", "<chain-id>", "<token-contract>", "<token-id>" });
        }

        void run(const arguments &args) const override
        {
            const auto reg_addr = address_t::from_hex(args.at(0));
            const auto b = binding_from_args(args, 1);
            std::cout << fmt::format("{}\n", tokenbind::registry::address::compute(reg_addr, b));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
