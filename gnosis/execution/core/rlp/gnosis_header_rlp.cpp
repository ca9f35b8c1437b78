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

#include <gnosis/core/assert.h>
#include <gnosis/core/byte_string.hpp>
#include <gnosis/core/cases.hpp>
#include <gnosis/core/int.hpp>
#include <gnosis/core/likely.h>
#include <gnosis/core/result.hpp>
#include <gnosis/core/rlp/config.hpp>
#include <gnosis/core/rlp/encode.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>
#include <gnosis/execution/core/rlp/address_rlp.hpp>
#include <gnosis/execution/core/rlp/block_rlp.hpp>
#include <gnosis/execution/core/rlp/bytes_rlp.hpp>
#include <gnosis/execution/core/rlp/gnosis_header_rlp.hpp>
#include <gnosis/execution/core/rlp/int_rlp.hpp>
#include <gnosis/execution/rlp/decode.hpp>
#include <gnosis/execution/rlp/decode_error.hpp>
#include <gnosis/execution/validate_header.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>

GNOSIS_RLP_NAMESPACE_BEGIN

namespace
{
    // the decoder marks each item before reading it, so that a failure
    // leaves behind the item and its position
    struct Cursor
    {
        HeaderField field{HeaderField::ListHeader};
        size_t expected{0};
        size_t actual{0};
        byte_string_view at{};

        void
        mark(HeaderField const f, byte_string_view const enc, size_t size = 0)
        {
            field = f;
            expected = size;
            actual = 0;
            at = enc;
        }
    };

    constexpr size_t hash_length(bytes32_t const &b)
    {
        return string_length(to_byte_string_view(b.bytes));
    }

    constexpr std::span<unsigned char>
    encode_hash(std::span<unsigned char> d, bytes32_t const &b)
    {
        return encode_string(d, to_byte_string_view(b.bytes));
    }

    // u64 header quantities are encoded as canonical big integers
    constexpr size_t quantity_length(uint64_t const n)
    {
        return unsigned_length(uint256_t{n});
    }

    constexpr std::span<unsigned char>
    encode_quantity(std::span<unsigned char> d, uint64_t const n)
    {
        return encode_unsigned(d, uint256_t{n});
    }

    size_t consensus_length(ConsensusFields const &consensus)
    {
        return std::visit(
            Cases{
                [](PostMerge const &post) {
                    return hash_length(post.mix_hash) +
                           string_length(to_byte_string_view(post.nonce));
                },
                [](PreMerge const &pre) {
                    return unsigned_length(pre.aura_step) +
                           string_length(to_byte_string_view(pre.aura_seal));
                }},
            consensus);
    }

    std::span<unsigned char> encode_consensus(
        std::span<unsigned char> d, ConsensusFields const &consensus)
    {
        return std::visit(
            Cases{
                [d](PostMerge const &post) {
                    auto rest = encode_hash(d, post.mix_hash);
                    return encode_string(rest, to_byte_string_view(post.nonce));
                },
                [d](PreMerge const &pre) {
                    auto rest = encode_unsigned(d, pre.aura_step);
                    return encode_string(
                        rest, to_byte_string_view(pre.aura_seal));
                }},
            consensus);
    }

    Result<ConsensusFields>
    decode_consensus(byte_string_view &enc, Cursor &cursor)
    {
        cursor.mark(HeaderField::MixHash, enc, sizeof(bytes32_t));
        BOOST_OUTCOME_TRY(auto const length, peek_string_length(enc));

        if (length == sizeof(bytes32_t)) {
            PostMerge post;
            BOOST_OUTCOME_TRY(post.mix_hash, decode_bytes32(enc));
            cursor.mark(HeaderField::Nonce, enc, post.nonce.size());
            BOOST_OUTCOME_TRY(post.nonce, decode_byte_string_fixed<8>(enc));
            return ConsensusFields{post};
        }

        PreMerge pre;
        cursor.mark(HeaderField::AuraStep, enc);
        BOOST_OUTCOME_TRY(pre.aura_step, decode_unsigned<uint256_t>(enc));
        cursor.mark(HeaderField::AuraSeal, enc, AURA_SEAL_SIZE);
        BOOST_OUTCOME_TRY(
            pre.aura_seal, decode_byte_string_fixed<AURA_SEAL_SIZE>(enc));
        return ConsensusFields{pre};
    }

    Result<GnosisHeader> decode_header(byte_string_view &enc, Cursor &cursor)
    {
        GnosisHeader header;
        auto rest = enc;

        cursor.mark(HeaderField::ListHeader, rest);
        BOOST_OUTCOME_TRY(auto const declared, parse_list_header(rest));

        // the items are read from the unsliced input; the declared length
        // is checked against the bytes consumed
        size_t const started = rest.size();
        auto const consumed = [&] { return started - rest.size(); };

        if (GNOSIS_UNLIKELY(declared > started)) {
            cursor.mark(HeaderField::ListLength, rest, declared);
            cursor.actual = started;
            return DecodeError::ListLengthMismatch;
        }

        cursor.mark(HeaderField::ParentHash, rest, sizeof(bytes32_t));
        BOOST_OUTCOME_TRY(header.parent_hash, decode_bytes32(rest));
        cursor.mark(HeaderField::OmmersHash, rest, sizeof(bytes32_t));
        BOOST_OUTCOME_TRY(header.ommers_hash, decode_bytes32(rest));
        cursor.mark(HeaderField::Beneficiary, rest, sizeof(Address));
        BOOST_OUTCOME_TRY(header.beneficiary, decode_address(rest));
        cursor.mark(HeaderField::StateRoot, rest, sizeof(bytes32_t));
        BOOST_OUTCOME_TRY(header.state_root, decode_bytes32(rest));
        cursor.mark(HeaderField::TransactionsRoot, rest, sizeof(bytes32_t));
        BOOST_OUTCOME_TRY(header.transactions_root, decode_bytes32(rest));
        cursor.mark(HeaderField::ReceiptsRoot, rest, sizeof(bytes32_t));
        BOOST_OUTCOME_TRY(header.receipts_root, decode_bytes32(rest));
        cursor.mark(HeaderField::LogsBloom, rest, header.logs_bloom.size());
        BOOST_OUTCOME_TRY(header.logs_bloom, decode_bloom(rest));
        cursor.mark(HeaderField::Difficulty, rest);
        BOOST_OUTCOME_TRY(header.difficulty, decode_unsigned<uint256_t>(rest));
        cursor.mark(HeaderField::Number, rest);
        BOOST_OUTCOME_TRY(header.number, decode_unsigned<uint64_t>(rest));
        cursor.mark(HeaderField::GasLimit, rest);
        BOOST_OUTCOME_TRY(header.gas_limit, decode_unsigned<uint64_t>(rest));
        cursor.mark(HeaderField::GasUsed, rest);
        BOOST_OUTCOME_TRY(header.gas_used, decode_unsigned<uint64_t>(rest));
        cursor.mark(HeaderField::Timestamp, rest);
        BOOST_OUTCOME_TRY(header.timestamp, decode_unsigned<uint64_t>(rest));
        cursor.mark(HeaderField::ExtraData, rest);
        BOOST_OUTCOME_TRY(header.extra_data, decode_string(rest));

        BOOST_OUTCOME_TRY(header.consensus, decode_consensus(rest, cursor));

        if (consumed() < declared) {
            cursor.mark(HeaderField::BaseFeePerGas, rest);
            BOOST_OUTCOME_TRY(
                header.base_fee_per_gas, decode_unsigned<uint64_t>(rest));
        }
        if (consumed() < declared) {
            cursor.mark(HeaderField::WithdrawalsRoot, rest, sizeof(bytes32_t));
            BOOST_OUTCOME_TRY(header.withdrawals_root, decode_bytes32(rest));
        }
        if (consumed() < declared) {
            cursor.mark(HeaderField::BlobGasUsed, rest);
            BOOST_OUTCOME_TRY(
                header.blob_gas_used, decode_unsigned<uint64_t>(rest));
        }
        if (consumed() < declared) {
            cursor.mark(HeaderField::ExcessBlobGas, rest);
            BOOST_OUTCOME_TRY(
                header.excess_blob_gas, decode_unsigned<uint64_t>(rest));
        }
        if (consumed() < declared) {
            cursor.mark(
                HeaderField::ParentBeaconBlockRoot, rest, sizeof(bytes32_t));
            BOOST_OUTCOME_TRY(
                header.parent_beacon_block_root, decode_bytes32(rest));
        }
        if (consumed() < declared) {
            cursor.mark(HeaderField::RequestsHash, rest, sizeof(bytes32_t));
            BOOST_OUTCOME_TRY(header.requests_hash, decode_bytes32(rest));
        }

        if (GNOSIS_UNLIKELY(consumed() != declared)) {
            cursor.mark(HeaderField::ListLength, rest, declared);
            cursor.actual = consumed();
            return DecodeError::ListLengthMismatch;
        }

        enc = rest;
        return header;
    }
}

char const *header_field_name(HeaderField const field)
{
    switch (field) {
    case HeaderField::ListHeader:
        return "list header";
    case HeaderField::ParentHash:
        return "parent hash";
    case HeaderField::OmmersHash:
        return "ommers hash";
    case HeaderField::Beneficiary:
        return "beneficiary";
    case HeaderField::StateRoot:
        return "state root";
    case HeaderField::TransactionsRoot:
        return "transactions root";
    case HeaderField::ReceiptsRoot:
        return "receipts root";
    case HeaderField::LogsBloom:
        return "logs bloom";
    case HeaderField::Difficulty:
        return "difficulty";
    case HeaderField::Number:
        return "number";
    case HeaderField::GasLimit:
        return "gas limit";
    case HeaderField::GasUsed:
        return "gas used";
    case HeaderField::Timestamp:
        return "timestamp";
    case HeaderField::ExtraData:
        return "extra data";
    case HeaderField::MixHash:
        return "mix hash";
    case HeaderField::Nonce:
        return "nonce";
    case HeaderField::AuraStep:
        return "aura step";
    case HeaderField::AuraSeal:
        return "aura seal";
    case HeaderField::BaseFeePerGas:
        return "base fee per gas";
    case HeaderField::WithdrawalsRoot:
        return "withdrawals root";
    case HeaderField::BlobGasUsed:
        return "blob gas used";
    case HeaderField::ExcessBlobGas:
        return "excess blob gas";
    case HeaderField::ParentBeaconBlockRoot:
        return "parent beacon block root";
    case HeaderField::RequestsHash:
        return "requests hash";
    case HeaderField::ListLength:
        return "list length";
    }
    GNOSIS_ABORT("unknown header field");
}

size_t gnosis_header_payload_length(GnosisHeader const &header)
{
    size_t length = 0;
    length += hash_length(header.parent_hash);
    length += hash_length(header.ommers_hash);
    length += string_length(to_byte_string_view(header.beneficiary.bytes));
    length += hash_length(header.state_root);
    length += hash_length(header.transactions_root);
    length += hash_length(header.receipts_root);
    length += string_length(to_byte_string_view(header.logs_bloom));
    length += unsigned_length(header.difficulty);
    length += quantity_length(header.number);
    length += quantity_length(header.gas_limit);
    length += quantity_length(header.gas_used);
    length += unsigned_length(header.timestamp);
    length += string_length(header.extra_data);
    length += consensus_length(header.consensus);

    if (header.base_fee_per_gas.has_value()) {
        length += quantity_length(header.base_fee_per_gas.value());
    }
    if (header.withdrawals_root.has_value()) {
        length += hash_length(header.withdrawals_root.value());
    }
    if (header.blob_gas_used.has_value()) {
        length += quantity_length(header.blob_gas_used.value());
    }
    if (header.excess_blob_gas.has_value()) {
        length += quantity_length(header.excess_blob_gas.value());
    }
    if (header.parent_beacon_block_root.has_value()) {
        length += hash_length(header.parent_beacon_block_root.value());
    }
    if (header.requests_hash.has_value()) {
        length += hash_length(header.requests_hash.value());
    }
    return length;
}

size_t gnosis_header_length(GnosisHeader const &header)
{
    return list_length(gnosis_header_payload_length(header));
}

std::span<unsigned char>
encode_gnosis_header(std::span<unsigned char> d, GnosisHeader const &header)
{
    d = encode_list_header(d, gnosis_header_payload_length(header));
    d = encode_hash(d, header.parent_hash);
    d = encode_hash(d, header.ommers_hash);
    d = encode_string(d, to_byte_string_view(header.beneficiary.bytes));
    d = encode_hash(d, header.state_root);
    d = encode_hash(d, header.transactions_root);
    d = encode_hash(d, header.receipts_root);
    d = encode_string(d, to_byte_string_view(header.logs_bloom));
    d = encode_unsigned(d, header.difficulty);
    d = encode_quantity(d, header.number);
    d = encode_quantity(d, header.gas_limit);
    d = encode_quantity(d, header.gas_used);
    d = encode_unsigned(d, header.timestamp);
    d = encode_string(d, header.extra_data);
    d = encode_consensus(d, header.consensus);

    if (header.base_fee_per_gas.has_value()) {
        d = encode_quantity(d, header.base_fee_per_gas.value());
    }
    if (header.withdrawals_root.has_value()) {
        d = encode_hash(d, header.withdrawals_root.value());
    }
    if (header.blob_gas_used.has_value()) {
        d = encode_quantity(d, header.blob_gas_used.value());
    }
    if (header.excess_blob_gas.has_value()) {
        d = encode_quantity(d, header.excess_blob_gas.value());
    }
    if (header.parent_beacon_block_root.has_value()) {
        d = encode_hash(d, header.parent_beacon_block_root.value());
    }
    if (header.requests_hash.has_value()) {
        d = encode_hash(d, header.requests_hash.value());
    }
    return d;
}

byte_string encode_gnosis_header(GnosisHeader const &header)
{
    byte_string encoded(gnosis_header_length(header), 0);
    auto const rest =
        encode_gnosis_header({encoded.data(), encoded.size()}, header);
    GNOSIS_ASSERT(rest.empty());
    return encoded;
}

Result<byte_string> encode_gnosis_header_strict(GnosisHeader const &header)
{
    BOOST_OUTCOME_TRY(validate_fork_fields(header));
    return encode_gnosis_header(header);
}

Result<GnosisHeader> decode_gnosis_header(byte_string_view &enc)
{
    Cursor cursor;
    return decode_header(enc, cursor);
}

Result<GnosisHeader> decode_gnosis_header(
    byte_string_view &enc, HeaderDecodeDiagnostics &diagnostics)
{
    Cursor cursor;
    auto result = decode_header(enc, cursor);
    if (result.has_error()) {
        diagnostics.field = cursor.field;
        diagnostics.expected = cursor.expected;
        if (cursor.field == HeaderField::ListHeader ||
            cursor.field == HeaderField::ListLength) {
            diagnostics.actual = cursor.actual;
        }
        else {
            auto const length = peek_string_length(cursor.at);
            diagnostics.actual = length.has_value() ? length.value() : 0;
        }
    }
    return result;
}

GNOSIS_RLP_NAMESPACE_END
