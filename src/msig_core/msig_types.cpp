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
#include "msig_types.h"

//local headers
#include "string_tools.h"

//third party headers

//standard headers
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig"

namespace msig
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string strip_hex_prefix(const std::string &hex)
{
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        return hex.substr(2);

    return hex;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
unsigned char scheme_flag(const SignatureScheme scheme)
{
    return static_cast<unsigned char>(scheme);
}
//-------------------------------------------------------------------------------------------------------------------
const char* scheme_name(const SignatureScheme scheme)
{
    switch (scheme)
    {
        case SignatureScheme::ED25519:   return "ed25519";
        case SignatureScheme::SECP256K1: return "secp256k1";
        case SignatureScheme::SECP256R1: return "secp256r1";
        case SignatureScheme::MULTISIG:  return "multisig";
        default:                         return "unknown";
    }
}
//-------------------------------------------------------------------------------------------------------------------
bool try_scheme_from_name(const std::string &name, SignatureScheme &scheme_out)
{
    for (const SignatureScheme scheme :
        {SignatureScheme::ED25519, SignatureScheme::SECP256K1, SignatureScheme::SECP256R1, SignatureScheme::MULTISIG})
    {
        if (name == scheme_name(scheme))
        {
            scheme_out = scheme;
            return true;
        }
    }

    return false;
}
//-------------------------------------------------------------------------------------------------------------------
std::string address_to_hex(const address_t &address)
{
    return epee::string_tools::pod_to_hex(address);
}
//-------------------------------------------------------------------------------------------------------------------
bool try_address_from_hex(const std::string &address_hex, address_t &address_out)
{
    return epee::string_tools::hex_to_pod(strip_hex_prefix(address_hex), address_out);
}
//-------------------------------------------------------------------------------------------------------------------
std::string public_key_to_hex(const public_key_bytes &public_key)
{
    return epee::string_tools::buff_to_hex_nodelimer(std::string{public_key.begin(), public_key.end()});
}
//-------------------------------------------------------------------------------------------------------------------
bool try_public_key_from_hex(const std::string &public_key_hex, public_key_bytes &public_key_out)
{
    std::string binary_key;
    if (!epee::string_tools::parse_hexstr_to_binbuff(strip_hex_prefix(public_key_hex), binary_key))
        return false;

    public_key_out.assign(binary_key.begin(), binary_key.end());
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace msig
