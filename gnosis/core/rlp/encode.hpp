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

#include <gnosis/core/assert.h>
#include <gnosis/core/byte_string.hpp>
#include <gnosis/core/int.hpp>
#include <gnosis/core/likely.h>
#include <gnosis/core/rlp/config.hpp>
#include <gnosis/core/unaligned.hpp>

#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <span>

// Allocation free RLP primitives. The *_length functions return the exact
// number of bytes the matching encode_* function writes; encode_* write at
// the front of the destination and return the unwritten tail.

GNOSIS_RLP_NAMESPACE_BEGIN

namespace impl
{
    constexpr size_t length_length(size_t const n)
    {
        size_t const lz_bits = static_cast<size_t>(std::countl_zero(n));
        size_t const lz_bytes = lz_bits / 8;
        return sizeof(size_t) - lz_bytes;
    }

    /**
     * always stores sizeof(size_t) bytes
     */
    constexpr std::span<unsigned char>
    encode_length(std::span<unsigned char> d, size_t n)
    {
        size_t const lz_bits = static_cast<size_t>(std::countl_zero(n));
        size_t const lz_bytes = lz_bits / 8;
        if (GNOSIS_LIKELY(n != 0)) {
            n <<= lz_bytes * 8;
        }

        size_t const n_be = std::byteswap(n);
        GNOSIS_ASSERT(d.size() >= sizeof(size_t));
        unaligned_store(d.data(), n_be);
        return d.subspan((sizeof(size_t) - lz_bytes));
    }

    constexpr std::span<unsigned char>
    encode_payload(std::span<unsigned char> d, byte_string_view const s)
    {
        GNOSIS_ASSERT(d.size() >= s.size());
        if (!s.empty()) {
            std::memcpy(d.data(), s.data(), s.size());
        }
        return d.subspan(s.size());
    }

    /**
     * big endian bytes of an unsigned integer with the leading zero bytes
     * stripped; zero has no significant bytes
     */
    template <unsigned_integral T>
    struct BigCompact
    {
        std::array<unsigned char, sizeof(T)> bytes;
        size_t offset;

        constexpr byte_string_view view() const
        {
            return {bytes.data() + offset, sizeof(T) - offset};
        }
    };

    template <unsigned_integral T>
    constexpr BigCompact<T> big_compact(T const n)
    {
        BigCompact<T> r{
            std::bit_cast<std::array<unsigned char, sizeof(T)>>(
                to_big_endian(n)),
            0};
        while (r.offset < sizeof(T) && r.bytes[r.offset] == 0) {
            ++r.offset;
        }
        return r;
    }
}

/**
 * max return value is 1 + sizeof(size_t) + s.size()
 */
constexpr size_t string_length(byte_string_view const s)
{
    if (s.size() == 1 and s[0] <= 0x7F) {
        return 1;
    }
    else if (s.size() <= 55) {
        return 1 + s.size();
    }
    else {
        return 1 + impl::length_length(s.size()) + s.size();
    }
}

constexpr std::span<unsigned char>
encode_string(std::span<unsigned char> d, byte_string_view const s)
{
    if (s.size() == 1 and s[0] <= 0x7F) {
        GNOSIS_ASSERT(!d.empty());
        d[0] = s[0];
        return d.subspan(1);
    }
    else if (s.size() <= 55) {
        GNOSIS_ASSERT(!d.empty());
        d[0] = 0x80 + static_cast<unsigned char>(s.size());
        d = d.subspan(1);
    }
    else {
        GNOSIS_ASSERT(!d.empty());
        d[0] = 0xB7 + static_cast<unsigned char>(impl::length_length(s.size()));
        d = d.subspan(1);
        d = impl::encode_length(d, s.size());
    }
    return impl::encode_payload(d, s);
}

/**
 * size of the list prefix alone
 */
constexpr size_t list_header_length(size_t const payload_size)
{
    if (payload_size <= 55) {
        return 1;
    }
    return 1 + impl::length_length(payload_size);
}

/**
 * max return value is 1 + sizeof(size_t) + concatenated_size
 */
constexpr size_t list_length(size_t const concatenated_size)
{
    return list_header_length(concatenated_size) + concatenated_size;
}

/**
 * writes the prefix of a list whose items total payload_size bytes; the
 * caller writes the items after it
 */
constexpr std::span<unsigned char>
encode_list_header(std::span<unsigned char> d, size_t const payload_size)
{
    GNOSIS_ASSERT(!d.empty());
    if (payload_size <= 55) {
        d[0] = 0xC0 + static_cast<unsigned char>(payload_size);
        return d.subspan(1);
    }
    d[0] = 0xF7 + static_cast<unsigned char>(impl::length_length(payload_size));
    d = d.subspan(1);
    return impl::encode_length(d, payload_size);
}

/**
 * canonical integer encoding: big endian without leading zero bytes, zero is
 * the empty string
 */
template <unsigned_integral T>
constexpr size_t unsigned_length(T const n)
{
    return string_length(impl::big_compact(n).view());
}

template <unsigned_integral T>
constexpr std::span<unsigned char>
encode_unsigned(std::span<unsigned char> d, T const n)
{
    auto const compact = impl::big_compact(n);
    return encode_string(d, compact.view());
}

GNOSIS_RLP_NAMESPACE_END
