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
#include <gnosis/execution/core/gnosis_header.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

GNOSIS_RLP_NAMESPACE_BEGIN

// Wire order of the header list items
enum class HeaderField : uint8_t
{
    ListHeader = 0,
    ParentHash,
    OmmersHash,
    Beneficiary,
    StateRoot,
    TransactionsRoot,
    ReceiptsRoot,
    LogsBloom,
    Difficulty,
    Number,
    GasLimit,
    GasUsed,
    Timestamp,
    ExtraData,
    MixHash,
    Nonce,
    AuraStep,
    AuraSeal,
    BaseFeePerGas,
    WithdrawalsRoot,
    BlobGasUsed,
    ExcessBlobGas,
    ParentBeaconBlockRoot,
    RequestsHash,
    ListLength,
};

char const *header_field_name(HeaderField);

/**
 * Where a decode stopped. For fixed size items expected is the size the
 * field requires and actual the payload size found; for ListHeader and
 * ListLength they are the declared and the available or consumed payload
 * sizes. Zero means not applicable.
 */
struct HeaderDecodeDiagnostics
{
    HeaderField field{HeaderField::ListHeader};
    size_t expected{0};
    size_t actual{0};
};

// Size of the list payload, without the list prefix
size_t gnosis_header_payload_length(GnosisHeader const &);

// Size of the complete encoding
size_t gnosis_header_length(GnosisHeader const &);

/**
 * Writes the encoding at the front of dest, which must hold at least
 * gnosis_header_length bytes, and returns the unwritten tail.
 */
std::span<unsigned char>
encode_gnosis_header(std::span<unsigned char> dest, GnosisHeader const &);

byte_string encode_gnosis_header(GnosisHeader const &);

// Rejects headers whose fork fields are not a prefix of the fork order
Result<byte_string> encode_gnosis_header_strict(GnosisHeader const &);

/**
 * Decodes one header from the front of enc and advances enc past it. enc is
 * left untouched on failure.
 *
 * The consensus variant is not tagged on the wire: a 32 byte item after the
 * extra data is taken as a mix hash, anything else as an aura step. An aura
 * step whose encoding is 32 bytes long is therefore read as a mix hash and
 * the decode fails at the nonce. Fork fields are read in fork order for as
 * long as the declared list payload is not exhausted.
 */
Result<GnosisHeader> decode_gnosis_header(byte_string_view &enc);
Result<GnosisHeader>
decode_gnosis_header(byte_string_view &enc, HeaderDecodeDiagnostics &);

GNOSIS_RLP_NAMESPACE_END
