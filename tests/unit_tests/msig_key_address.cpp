// Copyright (c) 2024, The Monero Project
//
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "msig_config.h"
#include "msig_core/key_address_utils.h"
#include "msig_core/msig_types.h"
#include "msig_core/multisig_address_errors.h"
#include "msig_impl/multisig_entrypoints.h"
#include "msig_test_utils.h"

#include "gtest/gtest.h"

#include <vector>

using namespace msig;

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void expect_address_error(const public_key_bytes &public_key,
    address_t (*key_to_address)(const public_key_bytes&),
    const MultisigAddressErrorCode expected_code)
{
    try
    {
        key_to_address(public_key);
        ADD_FAILURE() << "expected " << error_code_name(expected_code);
    }
    catch (const multisig_address_error &e)
    {
        EXPECT_EQ(e.error_code(), expected_code);
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------

//-------------------------------------------------------------------------------------------------------------------
TEST(msig_key_address, ed25519_vector)
{
    const address_t expected{test::address_from_hex_checked(test::ED25519_TEST_KEY_ADDRESS)};

    EXPECT_EQ(ed25519_key_to_address(test::ed25519_test_key()), expected);
    EXPECT_EQ(entrypoints::ed25519_key_to_address(test::ed25519_test_key()), expected);
    EXPECT_EQ(address_from_key(test::ed25519_test_key(), SignatureScheme::ED25519), expected);
    EXPECT_EQ(address_to_hex(expected), "73a6b3c33e2d63383de5c6786cbaca231ff789f4c853af6d54cb883d8780adc0");
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_key_address, secp256k1_vector)
{
    const address_t expected{test::address_from_hex_checked(test::SECP256K1_TEST_KEY_ADDRESS)};

    EXPECT_EQ(secp256k1_key_to_address(test::secp256k1_test_key()), expected);
    EXPECT_EQ(entrypoints::secp256k1_key_to_address(test::secp256k1_test_key()), expected);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_key_address, secp256r1_vector)
{
    const address_t expected{test::address_from_hex_checked(test::SECP256R1_TEST_KEY_ADDRESS)};

    EXPECT_EQ(secp256r1_key_to_address(test::secp256r1_test_key()), expected);
    EXPECT_EQ(entrypoints::secp256r1_key_to_address(test::secp256r1_test_key()), expected);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_key_address, invalid_key_length)
{
    // truncated key
    public_key_bytes short_key{test::ed25519_test_key()};
    short_key.pop_back();
    expect_address_error(short_key, &ed25519_key_to_address, MultisigAddressErrorCode::INVALID_KEY_LENGTH);

    // empty key
    expect_address_error(public_key_bytes{}, &secp256k1_key_to_address, MultisigAddressErrorCode::INVALID_KEY_LENGTH);

    // a secp256k1 key is one byte too long for ed25519 (length is checked before the flag)
    expect_address_error(test::secp256k1_test_key(),
        &ed25519_key_to_address,
        MultisigAddressErrorCode::INVALID_KEY_LENGTH);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_key_address, invalid_key_flag)
{
    // secp256k1 and secp256r1 keys have the same size, only the flag differs
    expect_address_error(test::secp256r1_test_key(),
        &secp256k1_key_to_address,
        MultisigAddressErrorCode::INVALID_KEY_FLAG);
    expect_address_error(test::secp256k1_test_key(),
        &secp256r1_key_to_address,
        MultisigAddressErrorCode::INVALID_KEY_FLAG);

    // multisig flag on an ed25519-sized key
    public_key_bytes bad_flag_key{test::ed25519_test_key()};
    bad_flag_key[0] = config::MSIG_FLAG_MULTISIG;
    expect_address_error(bad_flag_key, &ed25519_key_to_address, MultisigAddressErrorCode::INVALID_KEY_FLAG);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_key_address, generic_key_shape)
{
    // arbitrary (size, flag) pairs are accepted by the generic derivation
    const public_key_bytes custom_key{0x07, 0x01, 0x02};
    EXPECT_NO_THROW(address_from_key(custom_key, 3, 0x07));
    EXPECT_THROW(address_from_key(custom_key, 3, 0x08), multisig_address_error);
    EXPECT_THROW(address_from_key(custom_key, 4, 0x07), multisig_address_error);

    // the scheme flag is part of the hashed bytes
    public_key_bytes reflagged_key{test::secp256k1_test_key()};
    reflagged_key[0] = config::MSIG_FLAG_SECP256R1;
    EXPECT_NE(secp256r1_key_to_address(reflagged_key), secp256k1_key_to_address(test::secp256k1_test_key()));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_key_address, validate_public_key)
{
    EXPECT_TRUE(validate_public_key(test::ed25519_test_key(), SignatureScheme::ED25519));
    EXPECT_TRUE(validate_public_key(test::secp256k1_test_key(), SignatureScheme::SECP256K1));
    EXPECT_TRUE(validate_public_key(test::secp256r1_test_key(), SignatureScheme::SECP256R1));

    EXPECT_FALSE(validate_public_key(test::ed25519_test_key(), SignatureScheme::SECP256K1));
    EXPECT_FALSE(validate_public_key(test::secp256k1_test_key(), SignatureScheme::SECP256R1));
    EXPECT_FALSE(validate_public_key(public_key_bytes{}, SignatureScheme::ED25519));
    EXPECT_FALSE(validate_public_key(test::ed25519_test_key(), SignatureScheme::MULTISIG));

    EXPECT_EQ(expected_public_key_size(SignatureScheme::ED25519), 33u);
    EXPECT_EQ(expected_public_key_size(SignatureScheme::SECP256K1), 34u);
    EXPECT_EQ(expected_public_key_size(SignatureScheme::SECP256R1), 34u);
    EXPECT_EQ(expected_public_key_size(SignatureScheme::MULTISIG), 0u);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_key_address, hex_conversions)
{
    address_t address;
    EXPECT_TRUE(try_address_from_hex(test::ED25519_TEST_KEY_ADDRESS, address));
    EXPECT_EQ("0x" + address_to_hex(address), test::ED25519_TEST_KEY_ADDRESS);

    EXPECT_FALSE(try_address_from_hex("0x1234", address));
    EXPECT_FALSE(try_address_from_hex("zz", address));

    public_key_bytes public_key;
    EXPECT_TRUE(try_public_key_from_hex(public_key_to_hex(test::secp256r1_test_key()), public_key));
    EXPECT_EQ(public_key, test::secp256r1_test_key());
    EXPECT_EQ(public_key_to_hex(test::ed25519_test_key()),
        "000d7dab358c8dadaa4efa0049a75b07436555b10a368219bb680f70571349d775");

    SignatureScheme scheme;
    EXPECT_TRUE(try_scheme_from_name("secp256r1", scheme));
    EXPECT_EQ(scheme, SignatureScheme::SECP256R1);
    EXPECT_FALSE(try_scheme_from_name("bls12381", scheme));
}
//-------------------------------------------------------------------------------------------------------------------
