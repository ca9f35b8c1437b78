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
#include <gnosis/core/cases.hpp>
#include <gnosis/execution/core/fmt/bytes_fmt.hpp>
#include <gnosis/execution/core/fmt/int_fmt.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>
#include <quill/bundled/fmt/std.h>

#include <span>
#include <variant>

template <>
struct quill::copy_loggable<gnosis::ConsensusFields> : std::true_type
{
};

template <>
struct fmt::formatter<gnosis::ConsensusFields> : public gnosis::BasicFormatter
{
    template <typename FormatContext>
    auto format(gnosis::ConsensusFields const &value, FormatContext &ctx) const
    {
        std::visit(
            gnosis::Cases{
                [&ctx](gnosis::PostMerge const &post) {
                    fmt::format_to(
                        ctx.out(),
                        "PostMerge{{Mix Hash={} Nonce=0x{:02x}}}",
                        post.mix_hash,
                        fmt::join(std::as_bytes(std::span(post.nonce)), ""));
                },
                [&ctx](gnosis::PreMerge const &pre) {
                    fmt::format_to(
                        ctx.out(),
                        "PreMerge{{Aura Step={} Aura Seal=0x{:02x}}}",
                        pre.aura_step,
                        fmt::join(std::as_bytes(std::span(pre.aura_seal)), ""));
                }},
            value);
        return ctx.out();
    }
};

template <>
struct quill::copy_loggable<gnosis::GnosisHeader> : std::true_type
{
};

template <>
struct fmt::formatter<gnosis::GnosisHeader> : public gnosis::BasicFormatter
{
    template <typename FormatContext>
    auto format(gnosis::GnosisHeader const &bh, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "GnosisHeader{{"
            "Parent Hash={} "
            "Ommers Hash={} "
            "Beneficiary Address={} "
            "State Root={} "
            "Transaction Root={} "
            "Receipt Root={} "
            "Logs Bloom=0x{:02x} "
            "Difficulty={} "
            "Block Number={} "
            "Gas Limit={} "
            "Gas Used={} "
            "Timestamp={} "
            "Extra Data=0x{:02x} "
            "Consensus={} "
            "Base Fee Per Gas={} "
            "Withdrawal Root={} "
            "Blob Gas Used={} "
            "Excess Blob Gas={} "
            "Parent Beacon Block Root={} "
            "Requests Hash={}"
            "}}",
            bh.parent_hash,
            bh.ommers_hash,
            bh.beneficiary,
            bh.state_root,
            bh.transactions_root,
            bh.receipts_root,
            fmt::join(std::as_bytes(std::span(bh.logs_bloom)), ""),
            bh.difficulty,
            bh.number,
            bh.gas_limit,
            bh.gas_used,
            bh.timestamp,
            fmt::join(std::as_bytes(std::span(bh.extra_data)), ""),
            bh.consensus,
            bh.base_fee_per_gas,
            bh.withdrawals_root,
            bh.blob_gas_used,
            bh.excess_blob_gas,
            bh.parent_beacon_block_root,
            bh.requests_hash);
        return ctx.out();
    }
};
