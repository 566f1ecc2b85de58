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

#include <restake/execution/core/address.hpp>
#include <restake/execution/vault/config.hpp>

RESTAKE_VAULT_NAMESPACE_BEGIN

// The vault account: holds the deposited native assets, the share ledger and
// the request ledger. It is the delegator of record at the gateway.
inline constexpr Address VAULT_CA{0x1100};

RESTAKE_VAULT_NAMESPACE_END
