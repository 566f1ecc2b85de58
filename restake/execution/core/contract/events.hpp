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
#include <restake/core/config.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/receipt.hpp>

#include <utility>

RESTAKE_NAMESPACE_BEGIN

// Builds a log in the solidity layout. Topic 0 is the event signature, every
// indexed account follows as a topic and every other argument is one ABI word
// of data, in declaration order.
class EventBuilder
{
    Receipt::Log log_;

public:
    EventBuilder(Address const &emitter, bytes32_t const &signature)
    {
        log_.address = emitter;
        log_.topics.push_back(signature);
    }

    EventBuilder &&indexed(Address const &account) &&
    {
        log_.topics.push_back(abi_encode_address(account));
        return std::move(*this);
    }

    template <BigEndianType I>
    EventBuilder &&data(I const &v) &&
    {
        log_.data += abi_encode_uint(v);
        return std::move(*this);
    }

    Receipt::Log build() &&
    {
        return std::move(log_);
    }
};

RESTAKE_NAMESPACE_END
