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

// Core types for weighted multisig address derivation.

#pragma once

//local headers
#include "msig_config.h"

//third party headers

//standard headers
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

//forward declarations


namespace msig
{

/// signature schemes, identified by the flag byte they prefix to keys and preimages
enum class SignatureScheme : unsigned char
{
    ED25519   = config::MSIG_FLAG_ED25519,
    SECP256K1 = config::MSIG_FLAG_SECP256K1,
    SECP256R1 = config::MSIG_FLAG_SECP256R1,
    MULTISIG  = config::MSIG_FLAG_MULTISIG
};

/// a flagged public key: scheme flag || raw key bytes
using public_key_bytes = std::vector<unsigned char>;

/// signer weight
using multisig_weight_t = std::uint8_t;
/// multisig threshold (minimum weight sum that authorizes the account)
using multisig_threshold_t = std::uint16_t;

////
// address_t
// - 32-byte account address
///
struct address_t final
{
    unsigned char bytes[config::MSIG_ADDRESS_SIZE];
};
static_assert(sizeof(address_t) == config::MSIG_ADDRESS_SIZE, "");

inline bool operator==(const address_t &a, const address_t &b)
{
    return memcmp(a.bytes, b.bytes, sizeof(address_t::bytes)) == 0;
}
inline bool operator!=(const address_t &a, const address_t &b) { return !(a == b); }

////
// MultisigSpec
// - a multisig key set with parallel weights and a threshold
// - the order of keys is part of the address: reordering keys changes the derived address
///
struct MultisigSpec final
{
    /// flagged public keys of the signers
    std::vector<public_key_bytes> public_keys;
    /// weight of each signer (weights[i] belongs to public_keys[i])
    std::vector<multisig_weight_t> weights;
    /// minimum sum of signer weights required to authorize the account
    multisig_threshold_t threshold;
};

/// flag byte of a scheme
unsigned char scheme_flag(const SignatureScheme scheme);
/// human-readable scheme name
const char* scheme_name(const SignatureScheme scheme);
/// parse a scheme name ('ed25519', 'secp256k1', 'secp256r1', 'multisig')
bool try_scheme_from_name(const std::string &name, SignatureScheme &scheme_out);

/// hex encoding of an address (lowercase, no '0x' prefix)
std::string address_to_hex(const address_t &address);
/// parse a hex address (an optional '0x' prefix is accepted)
bool try_address_from_hex(const std::string &address_hex, address_t &address_out);
/// hex encoding of a flagged public key
std::string public_key_to_hex(const public_key_bytes &public_key);
/// parse a hex public key
bool try_public_key_from_hex(const std::string &public_key_hex, public_key_bytes &public_key_out);

} //namespace msig
