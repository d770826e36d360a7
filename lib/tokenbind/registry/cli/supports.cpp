/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/registry/registry.hpp>
#include "common.hpp"

namespace tokenbind::cli::registry::supports {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "supports";
            cmd.desc = "Print whether a registry supports the given 4-byte interface id";
            cmd.args.expect({ "<registry>", "<interface-id>" });
        }

        void run(const arguments &args) const override
        {
            const auto reg_addr = address_t::from_hex(args.at(0));
            const auto id = selector_t::from_hex(args.at(1));
            const auto res = registry_t::supports(id);
            logger::debug("registry {}: interface {} supported: {}", reg_addr, id, res);
            std::cout << fmt::format("{}\n", res);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
