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

#include <gnosis/core/byte_string.hpp>
#include <gnosis/core/cases.hpp>
#include <gnosis/core/config.hpp>
#include <gnosis/core/int.hpp>
#include <gnosis/core/result.hpp>
#include <gnosis/execution/core/compact_header.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>

GNOSIS_NAMESPACE_BEGIN

CompactHeader to_compact_header(GnosisHeader const &header)
{
    CompactHeader compact{
        .parent_hash = header.parent_hash,
        .ommers_hash = header.ommers_hash,
        .beneficiary = header.beneficiary,
        .state_root = header.state_root,
        .transactions_root = header.transactions_root,
        .receipts_root = header.receipts_root,
        .logs_bloom = header.logs_bloom,
        .difficulty = header.difficulty,
        .number = header.number,
        .gas_limit = header.gas_limit,
        .gas_used = header.gas_used,
        .timestamp = header.timestamp,
        .extra_data = header.extra_data,
        .base_fee_per_gas = header.base_fee_per_gas,
        .withdrawals_root = header.withdrawals_root,
        .blob_gas_used = header.blob_gas_used,
        .excess_blob_gas = header.excess_blob_gas,
        .parent_beacon_block_root = header.parent_beacon_block_root,
        .requests_hash = header.requests_hash};

    std::visit(
        Cases{
            [&compact](PostMerge const &post) {
                compact.mix_hash = post.mix_hash;
                compact.nonce =
                    intx::be::unsafe::load<uint64_t>(post.nonce.data());
            },
            [&compact](PreMerge const &pre) {
                compact.aura_step = pre.aura_step;
                compact.aura_seal = pre.aura_seal;
            }},
        header.consensus);

    return compact;
}

Result<GnosisHeader> from_compact_header(CompactHeader const &compact)
{
    std::optional<byte_string_fixed<8>> nonce;
    if (compact.nonce.has_value()) {
        nonce.emplace();
        intx::be::unsafe::store<uint64_t>(
            nonce->data(), compact.nonce.value());
    }

    BOOST_OUTCOME_TRY(
        auto consensus,
        make_consensus_fields(
            compact.mix_hash, nonce, compact.aura_step, compact.aura_seal));

    return GnosisHeader{
        .parent_hash = compact.parent_hash,
        .ommers_hash = compact.ommers_hash,
        .beneficiary = compact.beneficiary,
        .state_root = compact.state_root,
        .transactions_root = compact.transactions_root,
        .receipts_root = compact.receipts_root,
        .logs_bloom = compact.logs_bloom,
        .difficulty = compact.difficulty,
        .number = compact.number,
        .gas_limit = compact.gas_limit,
        .gas_used = compact.gas_used,
        .timestamp = compact.timestamp,
        .extra_data = compact.extra_data,
        .consensus = std::move(consensus),
        .base_fee_per_gas = compact.base_fee_per_gas,
        .withdrawals_root = compact.withdrawals_root,
        .blob_gas_used = compact.blob_gas_used,
        .excess_blob_gas = compact.excess_blob_gas,
        .parent_beacon_block_root = compact.parent_beacon_block_root,
        .requests_hash = compact.requests_hash};
}

GNOSIS_NAMESPACE_END
