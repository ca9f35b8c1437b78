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

#include <gnosis/core/byte_string.hpp>
#include <gnosis/core/result.hpp>
#include <gnosis/core/rlp/config.hpp>
#include <gnosis/execution/core/address.hpp>
#include <gnosis/execution/rlp/decode.hpp>
#include <gnosis/execution/rlp/encode2.hpp>

#include <boost/outcome/try.hpp>

#include <cstring>

GNOSIS_RLP_NAMESPACE_BEGIN

inline byte_string encode_address(Address const &address)
{
    return encode_string2(to_byte_string_view(address.bytes));
}

inline Result<Address> decode_address(byte_string_view &enc)
{
    Address addr;
    BOOST_OUTCOME_TRY(auto const byte_array, decode_byte_string_fixed<20>(enc));
    std::memcpy(addr.bytes, byte_array.data(), 20);
    return addr;
}

GNOSIS_RLP_NAMESPACE_END
