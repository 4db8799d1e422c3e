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

// Shared fixtures for msig unit tests.

#pragma once

#include "msig_core/msig_types.h"

#include "gtest/gtest.h"

#include <cstdint>
#include <string>
#include <vector>

namespace msig
{
namespace test
{

/// ed25519 key (flag 0x00, 33 bytes)
inline public_key_bytes ed25519_test_key()
{
  return {0, 13, 125, 171, 53, 140, 141, 173, 170, 78, 250, 0, 73, 167, 91, 7, 67,
    101, 85, 177, 10, 54, 130, 25, 187, 104, 15, 112, 87, 19, 73, 215, 117};
}

/// secp256k1 key (flag 0x01, 34 bytes)
inline public_key_bytes secp256k1_test_key()
{
  return {1, 2, 14, 23, 205, 89, 57, 228, 107, 25, 102, 65, 150, 140, 215, 89, 145,
    11, 162, 87, 126, 39, 250, 115, 253, 227, 135, 109, 185, 190, 197, 188, 235, 43};
}

/// secp256r1 key (flag 0x02, 34 bytes)
inline public_key_bytes secp256r1_test_key()
{
  return {2, 3, 71, 251, 175, 35, 240, 56, 171, 196, 195, 8, 162, 113, 17, 122, 42,
    76, 255, 174, 221, 188, 95, 248, 28, 117, 23, 188, 108, 116, 167, 237, 180, 48};
}

/// [ed25519, secp256k1, secp256r1]
inline std::vector<public_key_bytes> three_test_keys()
{
  return {ed25519_test_key(), secp256k1_test_key(), secp256r1_test_key()};
}

/// make a dummy ed25519-shaped key whose body bytes are all 'fill'
inline public_key_bytes dummy_ed25519_key(const unsigned char fill)
{
  public_key_bytes key(33, fill);
  key[0] = 0x00;
  return key;
}

/// parse a hex address (test fixtures are known to be valid)
inline address_t address_from_hex_checked(const std::string &address_hex)
{
  address_t address;
  EXPECT_TRUE(try_address_from_hex(address_hex, address));
  return address;
}

/// H_32 of ed25519_test_key()
constexpr const char *ED25519_TEST_KEY_ADDRESS{"0x73a6b3c33e2d63383de5c6786cbaca231ff789f4c853af6d54cb883d8780adc0"};
/// H_32 of secp256k1_test_key()
constexpr const char *SECP256K1_TEST_KEY_ADDRESS{"d9607cd03428c904949572b51471e7a9f60019aeb9a3d7ee5e72921cab8e8be7"};
/// H_32 of secp256r1_test_key()
constexpr const char *SECP256R1_TEST_KEY_ADDRESS{"600b1081644fe46f76da3bdc19f8743b9f04458516364374c7d82959e790c19e"};
/// three_test_keys(), weights [1, 1, 1], threshold 2
constexpr const char *THREE_KEY_MULTISIG_ADDRESS{"0x1c4dac7fb4c01a0c608db993711c451ad655a38b7f0a9571ff099f70090263a8"};
/// three_test_keys(), weights [1, 2, 3], threshold 3
constexpr const char *THREE_KEY_WEIGHTED_MULTISIG_ADDRESS{"ec1c55cc4266b43837ccb32c52907f1bd109db4aecb56bdad556b1ec33bc682c"};
/// three_test_keys(), weights [255, 255, 255], threshold 258
constexpr const char *THREE_KEY_HEAVY_MULTISIG_ADDRESS{"a4db39c8a4bdbcc46860b3b169d1f2970f1a6b32cd72f84b53a21a4bba30b42e"};

} //namespace test
} //namespace msig
