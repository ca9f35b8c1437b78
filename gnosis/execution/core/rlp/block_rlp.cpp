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
#include <gnosis/core/int.hpp>
#include <gnosis/core/likely.h>
#include <gnosis/core/result.hpp>
#include <gnosis/core/rlp/config.hpp>
#include <gnosis/execution/core/block.hpp>
#include <gnosis/execution/core/rlp/address_rlp.hpp>
#include <gnosis/execution/core/rlp/block_rlp.hpp>
#include <gnosis/execution/core/rlp/bytes_rlp.hpp>
#include <gnosis/execution/core/rlp/int_rlp.hpp>
#include <gnosis/execution/rlp/decode.hpp>
#include <gnosis/execution/rlp/decode_error.hpp>
#include <gnosis/execution/rlp/encode2.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstdint>
#include <optional>
#include <utility>

GNOSIS_RLP_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

namespace
{
    // present fork fields in fork order; absent ones are skipped
    byte_string encode_fork_fields(BlockHeader const &header)
    {
        byte_string out;
        if (header.base_fee_per_gas.has_value()) {
            out += encode_unsigned(*header.base_fee_per_gas);
        }
        if (header.withdrawals_root.has_value()) {
            out += encode_bytes32(*header.withdrawals_root);
        }
        if (header.blob_gas_used.has_value()) {
            out += encode_unsigned(*header.blob_gas_used);
        }
        if (header.excess_blob_gas.has_value()) {
            out += encode_unsigned(*header.excess_blob_gas);
        }
        if (header.parent_beacon_block_root.has_value()) {
            out += encode_bytes32(*header.parent_beacon_block_root);
        }
        if (header.requests_hash.has_value()) {
            out += encode_bytes32(*header.requests_hash);
        }
        return out;
    }

    // fills field from the next item while the list payload lasts
    template <typename T, typename Decode>
    Result<void> decode_trailing(
        byte_string_view &payload, std::optional<T> &field, Decode &&decode)
    {
        if (payload.empty()) {
            return success();
        }
        BOOST_OUTCOME_TRY(auto value, decode(payload));
        field.emplace(std::move(value));
        return success();
    }
}

byte_string encode_block_header(BlockHeader const &header)
{
    return encode_list2(
        encode_bytes32(header.parent_hash),
        encode_bytes32(header.ommers_hash),
        encode_address(header.beneficiary),
        encode_bytes32(header.state_root),
        encode_bytes32(header.transactions_root),
        encode_bytes32(header.receipts_root),
        encode_bloom(header.logs_bloom),
        encode_unsigned(header.difficulty),
        encode_unsigned(header.number),
        encode_unsigned(header.gas_limit),
        encode_unsigned(header.gas_used),
        encode_unsigned(header.timestamp),
        encode_string2(header.extra_data),
        encode_bytes32(header.prev_randao),
        encode_string2(to_byte_string_view(header.nonce)),
        encode_fork_fields(header));
}

Result<BlockHeader> decode_block_header(byte_string_view &enc)
{
    BlockHeader header;
    byte_string_view rest = enc;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(rest));

    BOOST_OUTCOME_TRY(header.parent_hash, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(header.ommers_hash, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(header.beneficiary, decode_address(payload));
    BOOST_OUTCOME_TRY(header.state_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(header.transactions_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(header.receipts_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(header.logs_bloom, decode_bloom(payload));
    BOOST_OUTCOME_TRY(header.difficulty, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(header.number, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(header.gas_limit, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(header.gas_used, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(header.timestamp, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(header.extra_data, decode_string(payload));
    BOOST_OUTCOME_TRY(header.prev_randao, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(header.nonce, decode_byte_string_fixed<8>(payload));

    auto const u64 = [](byte_string_view &p) {
        return decode_unsigned<uint64_t>(p);
    };
    auto const b32 = [](byte_string_view &p) { return decode_bytes32(p); };

    BOOST_OUTCOME_TRY(decode_trailing(payload, header.base_fee_per_gas, u64));
    BOOST_OUTCOME_TRY(decode_trailing(payload, header.withdrawals_root, b32));
    BOOST_OUTCOME_TRY(decode_trailing(payload, header.blob_gas_used, u64));
    BOOST_OUTCOME_TRY(decode_trailing(payload, header.excess_blob_gas, u64));
    BOOST_OUTCOME_TRY(
        decode_trailing(payload, header.parent_beacon_block_root, b32));
    BOOST_OUTCOME_TRY(decode_trailing(payload, header.requests_hash, b32));

    if (GNOSIS_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    enc = rest;
    return header;
}

GNOSIS_RLP_NAMESPACE_END
