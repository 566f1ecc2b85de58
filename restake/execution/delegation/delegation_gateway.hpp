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
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/delegation/config.hpp>

#include <cstdint>
#include <span>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

// The operator-layer interface a vault delegates through. Every call is
// atomic: it either applies its whole effect or fails without changing
// anything. `delegator` is the identity placing the call.
class DelegationGateway
{
public:
    virtual ~DelegationGateway() = default;

    virtual Result<void> delegate(
        Address const &delegator, OperatorId const &, Asset const &,
        uint256_t const &amount,
        std::span<uint64_t const> blueprint_selection) = 0;

    virtual Result<void> schedule_unstake(
        Address const &delegator, OperatorId const &, Asset const &,
        uint256_t const &amount) = 0;

    virtual Result<void> cancel_unstake(
        Address const &delegator, OperatorId const &, Asset const &,
        uint256_t const &amount) = 0;

    virtual Result<void> schedule_withdraw(
        Address const &delegator, Asset const &, uint256_t const &amount) = 0;

    virtual Result<void> execute_withdraw(Address const &delegator) = 0;

    virtual Result<void> cancel_withdraw(
        Address const &delegator, Asset const &, uint256_t const &amount) = 0;
};

RESTAKE_DELEGATION_NAMESPACE_END
