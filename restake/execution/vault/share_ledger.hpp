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

#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_slot.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/vault/config.hpp>
#include <restake/execution/vault/constants.hpp>
#include <restake/execution/vault/vault_accounting.hpp>

#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

// Share balances of the vault. One share is one unit of the underlying
// asset, so the claimable balance of an owner is its share balance.
class ShareLedger final : public VaultAccounting
{
    class Variables
    {
        State &state_;

        // Single slot constants all under namespace 0x0
        static constexpr auto AddressTotalSupply{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

        // The request ledger shares this account and owns namespaces 0x1 and
        // 0x2.
        enum Namespace : uint8_t
        {
            NSShares = 0x10,
        };

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        // mapping(address => uint256) shares
        StorageVariable<u256_be> shares(Address const &owner) const
        {
            return {state_, VAULT_CA, packed_slot(NSShares, owner)};
        }

        StorageVariable<u256_be> total_supply{
            state_, VAULT_CA, AddressTotalSupply};
    } vars;

public:
    explicit ShareLedger(State &);

    uint256_t shares_of(Address const &owner) const;
    uint256_t total_supply() const;

    Result<void> mint(Address const &owner, uint256_t const &shares);
    Result<void> burn(Address const &owner, uint256_t const &shares);

    uint256_t max_withdraw(Address const &owner) const override;
};

RESTAKE_VAULT_NAMESPACE_END
