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

#include <gnosis/core/bytes.hpp>
#include <gnosis/core/config.hpp>
#include <gnosis/core/keccak.hpp>
#include <gnosis/core/result.hpp>
#include <gnosis/execution/core/block.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>
#include <gnosis/execution/core/header_error.hpp>
#include <gnosis/execution/core/rlp/gnosis_header_rlp.hpp>

#include <optional>
#include <utility>
#include <variant>

GNOSIS_NAMESPACE_BEGIN

Result<ConsensusFields> make_consensus_fields(
    std::optional<bytes32_t> const &mix_hash,
    std::optional<byte_string_fixed<8>> const &nonce,
    std::optional<uint256_t> const &aura_step,
    std::optional<AuraSeal> const &aura_seal)
{
    bool const any_post = mix_hash.has_value() || nonce.has_value();
    bool const any_pre = aura_step.has_value() || aura_seal.has_value();

    if (any_post && any_pre) {
        return HeaderError::MixedConsensusFields;
    }
    if (mix_hash.has_value() && nonce.has_value()) {
        return ConsensusFields{PostMerge{*mix_hash, *nonce}};
    }
    if (aura_step.has_value() && aura_seal.has_value()) {
        return ConsensusFields{PreMerge{*aura_step, *aura_seal}};
    }
    return HeaderError::IncompleteConsensusFields;
}

bytes32_t hash(GnosisHeader const &header)
{
    auto const encoded = rlp::encode_gnosis_header(header);
    return to_bytes(keccak256(encoded));
}

BlockNumHash parent_num_hash(GnosisHeader const &header)
{
    return BlockNumHash{
        .number = header.number == 0 ? 0 : header.number - 1,
        .hash = header.parent_hash};
}

BlockNumHash num_hash(GnosisHeader const &header)
{
    return BlockNumHash{.number = header.number, .hash = hash(header)};
}

SealedGnosisHeader seal(GnosisHeader header, bytes32_t const &block_hash)
{
    return SealedGnosisHeader{.header = std::move(header), .hash = block_hash};
}

SealedGnosisHeader seal(GnosisHeader header)
{
    auto const block_hash = hash(header);
    return seal(std::move(header), block_hash);
}

Result<BlockHeader> to_block_header(GnosisHeader const &header)
{
    auto const *const post = std::get_if<PostMerge>(&header.consensus);
    if (post == nullptr) {
        return HeaderError::NotPostMerge;
    }

    return BlockHeader{
        .logs_bloom = header.logs_bloom,
        .parent_hash = header.parent_hash,
        .ommers_hash = header.ommers_hash,
        .state_root = header.state_root,
        .transactions_root = header.transactions_root,
        .receipts_root = header.receipts_root,
        .prev_randao = post->mix_hash,
        .difficulty = header.difficulty,
        .number = header.number,
        .gas_limit = header.gas_limit,
        .gas_used = header.gas_used,
        .timestamp = header.timestamp,
        .nonce = post->nonce,
        .extra_data = header.extra_data,
        .beneficiary = header.beneficiary,
        .base_fee_per_gas = header.base_fee_per_gas,
        .withdrawals_root = header.withdrawals_root,
        .blob_gas_used = header.blob_gas_used,
        .excess_blob_gas = header.excess_blob_gas,
        .parent_beacon_block_root = header.parent_beacon_block_root,
        .requests_hash = header.requests_hash};
}

GnosisHeader from_block_header(BlockHeader const &header)
{
    return GnosisHeader{
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
        .consensus = PostMerge{header.prev_randao, header.nonce},
        .base_fee_per_gas = header.base_fee_per_gas,
        .withdrawals_root = header.withdrawals_root,
        .blob_gas_used = header.blob_gas_used,
        .excess_blob_gas = header.excess_blob_gas,
        .parent_beacon_block_root = header.parent_beacon_block_root,
        .requests_hash = header.requests_hash};
}

GNOSIS_NAMESPACE_END
