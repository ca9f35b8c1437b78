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

#include <gnosis/core/basic_formatter.hpp>
#include <gnosis/core/bytes.hpp>
#include <gnosis/execution/core/address.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <span>

GNOSIS_NAMESPACE_BEGIN

// 0x prefixed lower case hex of a type with a fixed `bytes` array
struct FixedBytesFormatter : public BasicFormatter
{
    template <typename T, typename FormatContext>
    auto format(T const &value, FormatContext &ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "0x{:02x}",
            fmt::join(std::as_bytes(std::span(value.bytes)), ""));
    }
};

GNOSIS_NAMESPACE_END

template <>
struct quill::copy_loggable<gnosis::bytes32_t> : std::true_type
{
};

template <>
struct fmt::formatter<gnosis::bytes32_t> : public gnosis::FixedBytesFormatter
{
};

template <>
struct quill::copy_loggable<gnosis::Address> : std::true_type
{
};

template <>
struct fmt::formatter<gnosis::Address> : public gnosis::FixedBytesFormatter
{
};
