#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"
#include "numeric-cast.hpp"

namespace tokenbind::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct argument_config {
        std::vector<std::string> names {};
        size_t min = 0;
        size_t max = 0;

        void expect(const std::initializer_list<std::string> new_names)
        {
            names = new_names;
            min = 0;
            max = 0;
            for (const auto &n: names) {
                // names in square brackets are optional, a trailing ellipsis makes the count unbounded
                if (n.ends_with("...]")) {
                    max = std::numeric_limits<size_t>::max();
                } else {
                    if (!n.starts_with('['))
                        ++min;
                    if (max != std::numeric_limits<size_t>::max())
                        ++max;
                }
            }
        }
    };

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};

        option_config(std::string d, std::optional<std::string> def={}):
            desc { std::move(d) },
            default_value { std::move(def) }
        {
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        std::map<std::string, option_config> opts {};

        [[nodiscard]] std::string usage() const;
    };

    struct command {
        using ptr = std::shared_ptr<command>;
        using registry = std::map<std::string, ptr>;

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;

        virtual void run(const arguments &) const
        {
            throw error("a command must override one of the run methods!");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }

        static ptr reg(ptr cmd);
        static const registry &commands();
    };

    // Parses the arguments and options of a single command invocation
    // and fills in the default values of options that were not given.
    extern options parse(const config &cfg, const arguments &raw, arguments &args);
    extern int run(int argc, const char **argv);
}
