/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include "cli.hpp"

namespace tokenbind::cli {
    static command::registry &registry_mutable()
    {
        static command::registry reg {};
        return reg;
    }

    command::ptr command::reg(ptr cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a name!");
        if (const auto [it, created] = registry_mutable().try_emplace(cfg.name, cmd); !created) [[unlikely]]
            throw error(fmt::format("a duplicate command name: {}", cfg.name));
        return cmd;
    }

    const command::registry &command::commands()
    {
        return registry_mutable();
    }

    std::string config::usage() const
    {
        std::string res = name;
        for (const auto &n: args.names)
            res += fmt::format(" {}", n);
        for (const auto &[o_name, o_cfg]: opts)
            res += fmt::format(" [--{}{}]", o_name, o_cfg.default_value ? fmt::format("={}", *o_cfg.default_value) : "");
        return res;
    }

    options parse(const config &cfg, const arguments &raw, arguments &args)
    {
        options opts {};
        args.clear();
        for (const auto &a: raw) {
            if (a.starts_with("--")) {
                const auto eq_pos = a.find('=');
                auto name = a.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
                if (!cfg.opts.contains(name)) [[unlikely]]
                    throw error(fmt::format("{}: unsupported option --{}", cfg.name, name));
                std::optional<std::string> val {};
                if (eq_pos != std::string::npos)
                    val.emplace(a.substr(eq_pos + 1));
                opts.insert_or_assign(std::move(name), std::move(val));
            } else {
                args.emplace_back(a);
            }
        }
        if (args.size() < cfg.args.min || args.size() > cfg.args.max) [[unlikely]]
            throw error(fmt::format("{}: expected between {} and {} arguments but got {}; usage: {}",
                cfg.name, cfg.args.min, cfg.args.max, args.size(), cfg.usage()));
        for (const auto &[name, o_cfg]: cfg.opts) {
            if (!opts.contains(name) && o_cfg.default_value)
                opts.try_emplace(name, o_cfg.default_value);
        }
        return opts;
    }

    static void print_usage(const std::string_view bin_name)
    {
        std::cerr << fmt::format("Usage: {} <command> [<arg> ...]\nCommands:\n", bin_name);
        for (const auto &[name, cmd]: command::commands()) {
            config cfg {};
            cmd->configure(cfg);
            std::cerr << fmt::format("  {}\n    {}\n", cfg.usage(), cfg.desc);
        }
    }

    int run(const int argc, const char **argv)
    {
        const std::string_view bin_name = argc > 0 ? argv[0] : "tokenbind";
        if (argc < 2) {
            print_usage(bin_name);
            return 1;
        }
        const std::string cmd_name { argv[1] };
        const auto &cmds = command::commands();
        const auto cmd_it = cmds.find(cmd_name);
        if (cmd_it == cmds.end()) {
            logger::error("unknown command: {}", cmd_name);
            print_usage(bin_name);
            return 1;
        }
        const auto ex = logger::run_log_errors([&] {
            config cfg {};
            cmd_it->second->configure(cfg);
            const arguments raw { argv + 2, argv + argc };
            arguments args {};
            const auto opts = parse(cfg, raw, args);
            cmd_it->second->run(args, opts);
        });
        return ex ? 1 : 0;
    }
}
