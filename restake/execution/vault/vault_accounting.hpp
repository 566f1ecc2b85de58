// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <restake/core/int.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/vault/config.hpp>

RESTAKE_VAULT_NAMESPACE_BEGIN

// Read-only view of the share accounting that owns the depositor balances.
class VaultAccounting
{
public:
    virtual ~VaultAccounting() = default;

    // amount of the underlying asset `owner` could withdraw right now
    virtual uint256_t max_withdraw(Address const &owner) const = 0;
};

RESTAKE_VAULT_NAMESPACE_END
