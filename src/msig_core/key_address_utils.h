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

// Single-key address derivation for flagged public keys.

#pragma once

//local headers
#include "msig_types.h"

//third party headers

//standard headers
#include <cstddef>

//forward declarations


namespace msig
{

/**
* brief: expected_public_key_size - size of a flagged public key of the given scheme
* param: scheme - ED25519, SECP256K1 or SECP256R1
* return: key size including the flag byte (0 for schemes that have no single key)
*/
std::size_t expected_public_key_size(const SignatureScheme scheme);
/**
* brief: validate_public_key - check the size and flag of a flagged public key
* param: public_key -
* param: scheme - expected scheme of the key
* return: true if the key has the expected size and flag byte
*/
bool validate_public_key(const public_key_bytes &public_key, const SignatureScheme scheme);
/**
* brief: address_from_key - derive the address of a single flagged public key
*   address = H_32(flag || pk)
* param: public_key - flagged public key
* param: expected_size - expected size of the key, flag included
* param: expected_flag - expected first byte of the key
* return: address of the key
* throw: multisig_address_error (INVALID_KEY_LENGTH, INVALID_KEY_FLAG)
*/
address_t address_from_key(const public_key_bytes &public_key,
    const std::size_t expected_size,
    const unsigned char expected_flag);
address_t address_from_key(const public_key_bytes &public_key, const SignatureScheme scheme);

address_t ed25519_key_to_address(const public_key_bytes &public_key);
address_t secp256k1_key_to_address(const public_key_bytes &public_key);
address_t secp256r1_key_to_address(const public_key_bytes &public_key);

} //namespace msig
