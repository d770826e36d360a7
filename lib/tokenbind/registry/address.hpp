#pragma once
/* This file is part of tokenbind project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the tokenbind source tree */

#include "binding.hpp"

namespace tokenbind::registry::address {
    // The address at which the registry deployed at the deployer address places the account of the binding.
    // Needs no ledger access: the result is known before the deployment.
    [[nodiscard]] extern address_t compute(const address_t &deployer, const binding_t &b);
}
