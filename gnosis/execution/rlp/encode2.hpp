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
#include <gnosis/core/int.hpp>
#include <gnosis/core/rlp/config.hpp>
#include <gnosis/core/rlp/encode.hpp>

#include <concepts>
#include <cstddef>

// Owning counterparts of the span encoders, for callers that build an
// encoding out of separately encoded items

GNOSIS_RLP_NAMESPACE_BEGIN

inline byte_string const EMPTY_STRING = {0x80};

inline byte_string encode_string2(byte_string_view const string_view)
{
    byte_string result(string_length(string_view), 0);
    encode_string({result.data(), result.size()}, string_view);
    return result;
}

inline byte_string encode_unsigned(unsigned_integral auto const &n)
{
    byte_string result(unsigned_length(n), 0);
    encode_unsigned({result.data(), result.size()}, n);
    return result;
}

template <std::convertible_to<byte_string_view>... Args>
byte_string encode_list2(Args const &...args)
{
    size_t const size = (size_t{0} + ... + byte_string_view{args}.size());
    byte_string result(list_length(size), 0);
    [[maybe_unused]] auto d =
        encode_list_header({result.data(), result.size()}, size);
    ((d = impl::encode_payload(d, byte_string_view{args})), ...);
    return result;
}

GNOSIS_RLP_NAMESPACE_END
