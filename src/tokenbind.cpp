/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include <tokenbind/common/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace tokenbind;
    return cli::run(argc, argv);
}
