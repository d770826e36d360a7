/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/crypto/keccak.hpp>
#include <tokenbind/registry/artifact.hpp>
#include "common.hpp"

namespace tokenbind::cli::registry::artifact {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "artifact";
            cmd.desc = "Print the init code, its hash and the runtime code of the account of a binding";
            cmd.args.expect({ "<implementation>", "<salt>", "<chain-id>", "<token-contract>", "<token-id>" });
        }

        void run(const arguments &args) const override
        {
            const auto b = binding_from_args(args, 0);
            const auto init = tokenbind::registry::artifact::init_code(b);
            const auto runtime = tokenbind::registry::artifact::runtime_code(b);
            std::cout << fmt::format("init code: 0x{}\n", buffer_lowercase { init.data(), init.size() });
            std::cout << fmt::format("init code hash: {}\n", crypto::keccak::digest<bytes32_t>(init));
            std::cout << fmt::format("runtime code: 0x{}\n", buffer_lowercase { runtime.data(), runtime.size() });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
