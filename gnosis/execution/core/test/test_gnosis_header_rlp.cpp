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
#include <gnosis/core/bytes.hpp>
#include <gnosis/core/int.hpp>
#include <gnosis/core/rlp/encode.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>
#include <gnosis/execution/core/header_error.hpp>
#include <gnosis/execution/core/rlp/gnosis_header_rlp.hpp>
#include <gnosis/execution/rlp/decode_error.hpp>
#include <gnosis/execution/rlp/encode2.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <variant>

using namespace evmc::literals;
using namespace gnosis;
using namespace gnosis::rlp;

namespace
{
    GnosisHeader make_post_merge_header()
    {
        return GnosisHeader{
            .parent_hash =
                0x1f4e0b8d9c3a4b5f6e7d8c9b0a1f2e3d4c5b6a79887766554433221100ffeedd_bytes32,
            .beneficiary = 0x9a2fd4a9b7a0c36e1f45d8ad2c1a5f6d3e7b0c81_address,
            .state_root =
                0x2a7c9e1b3d5f7a9c1e3b5d7f9a1c3e5b7d9f1a3c5e7b9d1f3a5c7e9b1d3f5a7c_bytes32,
            .difficulty = 0,
            .number = 33'000'000,
            .gas_limit = 17'000'000,
            .gas_used = 1'234'567,
            .timestamp = 1'700'000'000,
            .extra_data = {'n', 'e', 't', 'h', 'e', 'r', 'm', 'i', 'n', 'd'},
            .consensus = PostMerge{
                .mix_hash =
                    0x5c3b7f2e9a1d4c8b6e0f3a7d2c9b1e5f8a4d7c0b3e6f9a2d5c8b1e4f7a0d3c6b_bytes32,
                .nonce = {}}};
    }

    GnosisHeader make_pre_merge_header()
    {
        auto header = make_post_merge_header();
        header.number = 1'000'000;
        header.difficulty = uint256_t{0xfffffffe} << 96;
        AuraSeal seal{};
        for (size_t i = 0; i < seal.size(); ++i) {
            seal[i] = static_cast<unsigned char>(i + 1);
        }
        header.consensus =
            PreMerge{.aura_step = 340'000'000, .aura_seal = seal};
        return header;
    }

    void set_all_fork_fields(GnosisHeader &header)
    {
        header.base_fee_per_gas = 7;
        header.withdrawals_root =
            0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421_bytes32;
        header.blob_gas_used = 131072;
        header.excess_blob_gas = 0;
        header.parent_beacon_block_root =
            0x0b1e8c3f5d7a9b2c4e6f8a0d1c3b5e7f9a2d4c6b8e0f1a3c5d7b9e2f4a6c8d0e_bytes32;
        header.requests_hash =
            0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855_bytes32;
    }

    GnosisHeader decode_all(byte_string const &encoded)
    {
        byte_string_view view{encoded};
        auto const decoded = decode_gnosis_header(view);
        EXPECT_FALSE(decoded.has_error());
        EXPECT_EQ(view.size(), 0);
        return decoded.value();
    }
}

TEST(Rlp_GnosisHeader, default_post_merge_layout)
{
    GnosisHeader const header{};

    // 5 hashes, address, bloom, 5 zero scalars, empty extra data, mix hash
    // and nonce
    EXPECT_EQ(gnosis_header_payload_length(header), 493);
    EXPECT_EQ(gnosis_header_length(header), 496);

    auto const encoded = encode_gnosis_header(header);
    ASSERT_EQ(encoded.size(), 496);
    EXPECT_EQ(encoded[0], 0xf9);
    EXPECT_EQ(encoded[1], 0x01);
    EXPECT_EQ(encoded[2], 0xed);
    EXPECT_EQ(encoded[3], 0xa0);

    // nonce is the last item
    EXPECT_EQ(encoded[encoded.size() - 9], 0x88);
}

TEST(Rlp_GnosisHeader, default_pre_merge_layout)
{
    GnosisHeader const header{.consensus = PreMerge{}};

    // zero step is a single byte, the 65 byte seal takes a long prefix
    EXPECT_EQ(gnosis_header_payload_length(header), 519);

    auto const encoded = encode_gnosis_header(header);
    ASSERT_EQ(encoded.size(), gnosis_header_length(header));
    EXPECT_EQ(encoded[encoded.size() - 67], 0xb8);
    EXPECT_EQ(encoded[encoded.size() - 66], 0x41);
    EXPECT_EQ(encoded[encoded.size() - 68], 0x80);

    EXPECT_EQ(decode_all(encoded), header);
}

TEST(Rlp_GnosisHeader, encode_into_span)
{
    auto const header = make_pre_merge_header();
    byte_string buffer(gnosis_header_length(header) + 4, 0xee);

    auto const rest =
        encode_gnosis_header({buffer.data(), buffer.size()}, header);
    EXPECT_EQ(rest.size(), 4);
    EXPECT_EQ(
        byte_string_view(buffer.data(), buffer.size() - 4),
        encode_gnosis_header(header));
    EXPECT_EQ(buffer.back(), 0xee);
}

TEST(Rlp_GnosisHeader, length_matches_encoding)
{
    for (auto header : {make_post_merge_header(), make_pre_merge_header()}) {
        for (int forks = 0; forks <= 6; ++forks) {
            if (forks >= 1) {
                header.base_fee_per_gas = 1'000'000'000;
            }
            if (forks >= 2) {
                header.withdrawals_root = NULL_ROOT;
            }
            if (forks >= 3) {
                header.blob_gas_used = 262144;
            }
            if (forks >= 4) {
                header.excess_blob_gas = 0;
            }
            if (forks >= 5) {
                header.parent_beacon_block_root = NULL_ROOT;
            }
            if (forks >= 6) {
                header.requests_hash = NULL_ROOT;
            }

            auto const payload = gnosis_header_payload_length(header);
            auto const encoded = encode_gnosis_header(header);
            EXPECT_EQ(encoded.size(), gnosis_header_length(header));
            EXPECT_EQ(encoded.size(), list_header_length(payload) + payload);
        }
    }
}

TEST(Rlp_GnosisHeader, round_trip_post_merge)
{
    auto header = make_post_merge_header();
    EXPECT_EQ(decode_all(encode_gnosis_header(header)), header);

    set_all_fork_fields(header);
    auto const decoded = decode_all(encode_gnosis_header(header));
    EXPECT_EQ(decoded, header);
    EXPECT_TRUE(std::holds_alternative<PostMerge>(decoded.consensus));
    EXPECT_EQ(decoded.requests_hash, header.requests_hash);
}

TEST(Rlp_GnosisHeader, round_trip_pre_merge)
{
    auto header = make_pre_merge_header();
    auto decoded = decode_all(encode_gnosis_header(header));
    EXPECT_EQ(decoded, header);
    ASSERT_TRUE(std::holds_alternative<PreMerge>(decoded.consensus));
    EXPECT_EQ(std::get<PreMerge>(decoded.consensus).aura_step, 340'000'000);

    set_all_fork_fields(header);
    decoded = decode_all(encode_gnosis_header(header));
    EXPECT_EQ(decoded, header);
}

TEST(Rlp_GnosisHeader, round_trip_base_fee_only)
{
    auto header = make_post_merge_header();
    header.base_fee_per_gas = 1;

    auto const decoded = decode_all(encode_gnosis_header(header));
    EXPECT_EQ(decoded.base_fee_per_gas, 1);
    EXPECT_FALSE(decoded.withdrawals_root.has_value());
    EXPECT_FALSE(decoded.blob_gas_used.has_value());
    EXPECT_FALSE(decoded.excess_blob_gas.has_value());
    EXPECT_FALSE(decoded.parent_beacon_block_root.has_value());
    EXPECT_FALSE(decoded.requests_hash.has_value());
}

TEST(Rlp_GnosisHeader, round_trip_large_quantities)
{
    auto header = make_post_merge_header();
    header.number = 0x0102030405060708;
    header.gas_limit = UINT64_MAX;
    header.timestamp = UINT64_MAX;
    header.difficulty = UINT256_MAX;
    header.extra_data = byte_string(97, 0x42);

    EXPECT_EQ(decode_all(encode_gnosis_header(header)), header);
}

TEST(Rlp_GnosisHeader, aura_step_lengths)
{
    // every step whose encoding is not 32 bytes long is read back as a step
    for (unsigned shift : {0u, 7u, 8u, 64u, 200u, 247u}) {
        auto header = make_pre_merge_header();
        auto &pre = std::get<PreMerge>(header.consensus);
        pre.aura_step = uint256_t{1} << shift;
        EXPECT_EQ(decode_all(encode_gnosis_header(header)), header) << shift;
    }
}

TEST(Rlp_GnosisHeader, aura_step_of_32_bytes_reads_as_mix_hash)
{
    // the variant is not tagged on the wire: a 32 byte step is taken for a
    // mix hash, and the seal is then read as the nonce
    auto header = make_pre_merge_header();
    std::get<PreMerge>(header.consensus).aura_step = uint256_t{1} << 255;

    auto const encoded = encode_gnosis_header(header);
    byte_string_view view{encoded};
    HeaderDecodeDiagnostics diagnostics;
    auto const decoded = decode_gnosis_header(view, diagnostics);

    ASSERT_TRUE(decoded.has_error());
    EXPECT_TRUE(decoded.assume_error() == DecodeError::ArrayLengthUnexpected);
    EXPECT_EQ(diagnostics.field, HeaderField::Nonce);
    EXPECT_EQ(diagnostics.expected, 8);
    EXPECT_EQ(diagnostics.actual, AURA_SEAL_SIZE);
    EXPECT_EQ(view.size(), encoded.size());
}

TEST(Rlp_GnosisHeader, non_monotonic_fork_fields_shift)
{
    auto header = make_post_merge_header();
    header.excess_blob_gas = 7;

    auto const decoded = decode_all(encode_gnosis_header(header));
    EXPECT_EQ(decoded.base_fee_per_gas, 7);
    EXPECT_FALSE(decoded.excess_blob_gas.has_value());
    EXPECT_NE(decoded, header);
}

TEST(Rlp_GnosisHeader, non_monotonic_fork_fields_fail)
{
    auto header = make_post_merge_header();
    header.requests_hash =
        0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855_bytes32;

    auto const encoded = encode_gnosis_header(header);
    byte_string_view view{encoded};
    HeaderDecodeDiagnostics diagnostics;
    auto const decoded = decode_gnosis_header(view, diagnostics);

    ASSERT_TRUE(decoded.has_error());
    EXPECT_TRUE(decoded.assume_error() == DecodeError::Overflow);
    EXPECT_EQ(diagnostics.field, HeaderField::BaseFeePerGas);
    EXPECT_EQ(diagnostics.actual, 32);
}

TEST(Rlp_GnosisHeader, truncated_buffer)
{
    auto header = make_post_merge_header();
    set_all_fork_fields(header);
    auto const encoded = encode_gnosis_header(header);
    auto const payload = gnosis_header_payload_length(header);

    byte_string const truncated = encoded.substr(0, encoded.size() - 1);
    byte_string_view view{truncated};
    HeaderDecodeDiagnostics diagnostics;
    auto const decoded = decode_gnosis_header(view, diagnostics);

    ASSERT_TRUE(decoded.has_error());
    EXPECT_TRUE(decoded.assume_error() == DecodeError::ListLengthMismatch);
    EXPECT_EQ(diagnostics.field, HeaderField::ListLength);
    EXPECT_EQ(diagnostics.expected, payload);
    EXPECT_EQ(diagnostics.actual, payload - 1);
    EXPECT_EQ(view.size(), truncated.size());
}

TEST(Rlp_GnosisHeader, declared_length_shorter_than_items)
{
    GnosisHeader const header{};
    auto const encoded = encode_gnosis_header(header);
    ASSERT_EQ(encoded.substr(0, 3), byte_string({0xf9, 0x01, 0xed}));

    byte_string tampered = encoded;
    tampered[2] = 0xec;

    byte_string_view view{tampered};
    HeaderDecodeDiagnostics diagnostics;
    auto const decoded = decode_gnosis_header(view, diagnostics);

    ASSERT_TRUE(decoded.has_error());
    EXPECT_TRUE(decoded.assume_error() == DecodeError::ListLengthMismatch);
    EXPECT_EQ(diagnostics.field, HeaderField::ListLength);
    EXPECT_EQ(diagnostics.expected, 492);
    EXPECT_EQ(diagnostics.actual, 493);
}

TEST(Rlp_GnosisHeader, garbage_inside_list)
{
    GnosisHeader const header{};
    auto const encoded = encode_gnosis_header(header);

    // two stray single byte items after the nonce: the first is taken as
    // the base fee, the second cannot be a withdrawals root
    byte_string tampered = encoded;
    tampered[2] = 0xef;
    tampered += byte_string({0x01, 0x02});

    byte_string_view view{tampered};
    HeaderDecodeDiagnostics diagnostics;
    auto const decoded = decode_gnosis_header(view, diagnostics);

    ASSERT_TRUE(decoded.has_error());
    EXPECT_TRUE(decoded.assume_error() == DecodeError::ArrayLengthUnexpected);
    EXPECT_EQ(diagnostics.field, HeaderField::WithdrawalsRoot);
    EXPECT_EQ(diagnostics.expected, 32);
    EXPECT_EQ(diagnostics.actual, 1);
}

TEST(Rlp_GnosisHeader, trailing_bytes_after_list)
{
    auto const header = make_pre_merge_header();
    byte_string encoded = encode_gnosis_header(header);
    encoded += byte_string({0xc0, 0x80});

    byte_string_view view{encoded};
    auto const decoded = decode_gnosis_header(view);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), header);
    EXPECT_EQ(view, byte_string({0xc0, 0x80}));
}

TEST(Rlp_GnosisHeader, not_a_list)
{
    {
        byte_string const enc{0x80};
        byte_string_view view{enc};
        HeaderDecodeDiagnostics diagnostics;
        auto const decoded = decode_gnosis_header(view, diagnostics);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_TRUE(decoded.assume_error() == DecodeError::TypeUnexpected);
        EXPECT_EQ(diagnostics.field, HeaderField::ListHeader);
    }

    {
        byte_string_view view{};
        auto const decoded = decode_gnosis_header(view);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_TRUE(decoded.assume_error() == DecodeError::InputTooShort);
    }
}

TEST(Rlp_GnosisHeader, item_length_past_end_of_list)
{
    // the parent hash claims a length near the top of the size_t range
    byte_string const encoded{
        0xca, 0xbf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xf7, 0x00};

    byte_string_view view{encoded};
    HeaderDecodeDiagnostics diagnostics;
    auto const decoded = decode_gnosis_header(view, diagnostics);

    ASSERT_TRUE(decoded.has_error());
    EXPECT_TRUE(decoded.assume_error() == DecodeError::InputTooShort);
    EXPECT_EQ(diagnostics.field, HeaderField::ParentHash);
    EXPECT_EQ(view.size(), encoded.size());
}

TEST(Rlp_GnosisHeader, wrong_fixed_field_size)
{
    // a 19 byte beneficiary
    byte_string payload;
    payload += encode_string2(byte_string(32, 0x01));
    payload += encode_string2(byte_string(32, 0x02));
    payload += encode_string2(byte_string(19, 0x03));
    auto const encoded = encode_list2(payload);

    byte_string_view view{encoded};
    HeaderDecodeDiagnostics diagnostics;
    auto const decoded = decode_gnosis_header(view, diagnostics);

    ASSERT_TRUE(decoded.has_error());
    EXPECT_TRUE(decoded.assume_error() == DecodeError::ArrayLengthUnexpected);
    EXPECT_EQ(diagnostics.field, HeaderField::Beneficiary);
    EXPECT_EQ(diagnostics.expected, 20);
    EXPECT_EQ(diagnostics.actual, 19);
}

TEST(Rlp_GnosisHeader, extra_data_growth)
{
    auto header = make_post_merge_header();
    header.extra_data = byte_string(5, 0x01);
    auto const small = encode_gnosis_header(header);

    header.extra_data = byte_string(15, 0x01);
    auto const large = encode_gnosis_header(header);

    EXPECT_EQ(large.size() - small.size(), 10);
}

TEST(Rlp_GnosisHeader, strict_encoding)
{
    auto header = make_post_merge_header();
    set_all_fork_fields(header);

    auto const strict = encode_gnosis_header_strict(header);
    ASSERT_FALSE(strict.has_error());
    EXPECT_EQ(strict.value(), encode_gnosis_header(header));

    header.withdrawals_root.reset();
    auto const rejected = encode_gnosis_header_strict(header);
    ASSERT_TRUE(rejected.has_error());
    EXPECT_TRUE(
        rejected.assume_error() == HeaderError::NonMonotonicForkFields);
}

TEST(Rlp_GnosisHeader, field_names)
{
    EXPECT_STREQ(header_field_name(HeaderField::AuraSeal), "aura seal");
    EXPECT_STREQ(header_field_name(HeaderField::ListLength), "list length");
}
