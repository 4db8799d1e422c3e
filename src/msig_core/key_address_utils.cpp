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

//paired header
#include "key_address_utils.h"

//local headers
#include "misc_log_ex.h"
#include "msig_config.h"
#include "msig_crypto/msig_hash_functions.h"
#include "multisig_address_errors.h"

//third party headers

//standard headers
#include <cstddef>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig"

namespace msig
{
//-------------------------------------------------------------------------------------------------------------------
std::size_t expected_public_key_size(const SignatureScheme scheme)
{
    switch (scheme)
    {
        case SignatureScheme::ED25519:   return config::MSIG_ED25519_PUBLIC_KEY_SIZE;
        case SignatureScheme::SECP256K1: return config::MSIG_SECP256K1_PUBLIC_KEY_SIZE;
        case SignatureScheme::SECP256R1: return config::MSIG_SECP256R1_PUBLIC_KEY_SIZE;
        default:                         return 0;
    }
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_public_key(const public_key_bytes &public_key, const SignatureScheme scheme)
{
    const std::size_t expected_size{expected_public_key_size(scheme)};

    if (expected_size == 0)
        return false;
    if (public_key.size() != expected_size)
        return false;
    if (public_key[0] != scheme_flag(scheme))
        return false;

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
address_t address_from_key(const public_key_bytes &public_key,
    const std::size_t expected_size,
    const unsigned char expected_flag)
{
    MSIG_CHECK_AND_THROW(public_key.size() == expected_size,
        MultisigAddressErrorCode::INVALID_KEY_LENGTH,
        "public key has size " << public_key.size() << ", expected " << expected_size);
    MSIG_CHECK_AND_THROW(public_key.size() > 0 && public_key[0] == expected_flag,
        MultisigAddressErrorCode::INVALID_KEY_FLAG,
        "public key has an unexpected scheme flag");

    // address = H_32(flag || pk)
    // note: the flag is already the first byte of the key
    address_t address;
    msig_hash_to_32(public_key.data(), public_key.size(), address.bytes);

    return address;
}
//-------------------------------------------------------------------------------------------------------------------
address_t address_from_key(const public_key_bytes &public_key, const SignatureScheme scheme)
{
    return address_from_key(public_key, expected_public_key_size(scheme), scheme_flag(scheme));
}
//-------------------------------------------------------------------------------------------------------------------
address_t ed25519_key_to_address(const public_key_bytes &public_key)
{
    return address_from_key(public_key, config::MSIG_ED25519_PUBLIC_KEY_SIZE, config::MSIG_FLAG_ED25519);
}
//-------------------------------------------------------------------------------------------------------------------
address_t secp256k1_key_to_address(const public_key_bytes &public_key)
{
    return address_from_key(public_key, config::MSIG_SECP256K1_PUBLIC_KEY_SIZE, config::MSIG_FLAG_SECP256K1);
}
//-------------------------------------------------------------------------------------------------------------------
address_t secp256r1_key_to_address(const public_key_bytes &public_key)
{
    return address_from_key(public_key, config::MSIG_SECP256R1_PUBLIC_KEY_SIZE, config::MSIG_FLAG_SECP256R1);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace msig
