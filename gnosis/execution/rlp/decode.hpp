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
#include <gnosis/core/likely.h>
#include <gnosis/core/result.hpp>
#include <gnosis/core/rlp/config.hpp>
#include <gnosis/execution/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>

GNOSIS_RLP_NAMESPACE_BEGIN

template <unsigned_integral T>
constexpr Result<T> decode_raw_num(byte_string_view const enc)
{
    if (GNOSIS_UNLIKELY(enc.size() > sizeof(T))) {
        return DecodeError::Overflow;
    }

    if (enc.empty()) {
        return 0;
    }

    if (enc[0] == 0) {
        return DecodeError::LeadingZero;
    }

    T result{};
    std::memcpy(
        &intx::as_bytes(result)[sizeof(T) - enc.size()],
        enc.data(),
        enc.size());
    result = intx::to_big_endian(result);
    return result;
}

constexpr Result<size_t> decode_length(byte_string_view const enc)
{
    BOOST_OUTCOME_TRY(auto const length, decode_raw_num<size_t>(enc));
    // the long form is only used past the short form limit
    if (GNOSIS_UNLIKELY(length <= 55)) {
        return DecodeError::NonCanonical;
    }
    return length;
}

constexpr Result<byte_string_view> parse_string_metadata(byte_string_view &enc)
{
    size_t i = 0;
    size_t end = 0;

    if (GNOSIS_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (GNOSIS_UNLIKELY(enc[0] >= 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0x80) // [0x00, 0x7f]
    {
        end = i + 1;
    }
    else if (enc[0] < 0xb8) // [0x80, 0xb7]
    {
        ++i;
        uint8_t const length = enc[0] - 0x80;
        end = i + length;
        if (length == 1) {
            if (GNOSIS_UNLIKELY(enc.size() < 2)) {
                return DecodeError::InputTooShort;
            }
            // single bytes below 0x80 are their own encoding
            if (GNOSIS_UNLIKELY(enc[1] < 0x80)) {
                return DecodeError::NonCanonical;
            }
        }
    }
    else // [0xb8, 0xbf]
    {
        ++i;
        uint8_t const length_of_length = enc[0] - 0xb7;

        if (GNOSIS_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            auto const length, decode_length(enc.substr(i, length_of_length)));
        i += length_of_length;
        if (GNOSIS_UNLIKELY(length > enc.size() - i)) {
            return DecodeError::InputTooShort;
        }
        end = i + length;
    }

    if (GNOSIS_UNLIKELY(end > enc.size())) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, end - i);
    enc = enc.substr(end);
    return payload;
}

/**
 * consumes only the list prefix and returns the declared payload length,
 * without checking that the payload is present
 */
constexpr Result<size_t> parse_list_header(byte_string_view &enc)
{
    size_t i = 1;
    size_t length;

    if (GNOSIS_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (GNOSIS_UNLIKELY(enc[0] < 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0xf8) {
        length = enc[0] - 0xc0;
    }
    else {
        size_t const length_of_length = enc[0] - 0xf7;

        if (GNOSIS_UNLIKELY(i + length_of_length > enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            length, decode_length(enc.substr(i, length_of_length)));
        i += length_of_length;
    }

    enc = enc.substr(i);
    return length;
}

constexpr Result<byte_string_view> parse_list_metadata(byte_string_view &enc)
{
    auto rest = enc;
    BOOST_OUTCOME_TRY(auto const length, parse_list_header(rest));

    if (GNOSIS_UNLIKELY(length > rest.size())) {
        return DecodeError::InputTooShort;
    }

    auto const payload = rest.substr(0, length);
    enc = rest.substr(length);
    return payload;
}

/**
 * payload length of the next string item, leaving enc untouched
 */
constexpr Result<size_t> peek_string_length(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    return payload.size();
}

constexpr Result<byte_string_view> decode_string(byte_string_view &enc)
{
    return parse_string_metadata(enc);
}

template <size_t N>
constexpr Result<byte_string_fixed<N>>
decode_byte_string_fixed(byte_string_view &enc)
{
    byte_string_fixed<N> bsf;
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    if (GNOSIS_UNLIKELY(payload.size() != N)) {
        return DecodeError::ArrayLengthUnexpected;
    }
    std::memcpy(bsf.data(), payload.data(), N);
    return bsf;
}

GNOSIS_RLP_NAMESPACE_END
