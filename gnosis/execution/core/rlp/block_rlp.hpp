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
#include <gnosis/execution/core/block.hpp>
#include <gnosis/execution/rlp/decode.hpp>
#include <gnosis/execution/rlp/encode2.hpp>

GNOSIS_RLP_NAMESPACE_BEGIN

inline byte_string encode_bloom(Bloom const &bloom)
{
    return encode_string2(to_byte_string_view(bloom));
}

inline Result<Bloom> decode_bloom(byte_string_view &enc)
{
    return decode_byte_string_fixed<256>(enc);
}

byte_string encode_block_header(BlockHeader const &);

Result<BlockHeader> decode_block_header(byte_string_view &);

GNOSIS_RLP_NAMESPACE_END
