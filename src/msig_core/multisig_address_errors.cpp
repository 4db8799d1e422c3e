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
#include "multisig_address_errors.h"

//local headers

//third party headers

//standard headers
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig"

namespace msig
{
//-------------------------------------------------------------------------------------------------------------------
const char* error_code_name(const MultisigAddressErrorCode error_code)
{
    switch (error_code)
    {
        case MultisigAddressErrorCode::LENGTH_MISMATCH:        return "LengthMismatch";
        case MultisigAddressErrorCode::INVALID_THRESHOLD:      return "InvalidThreshold";
        case MultisigAddressErrorCode::INVALID_KEY_LENGTH:     return "InvalidKeyLength";
        case MultisigAddressErrorCode::INVALID_KEY_FLAG:       return "InvalidKeyFlag";
        case MultisigAddressErrorCode::NO_PERMUTATION_MATCHES: return "NoPermutationMatches";
        case MultisigAddressErrorCode::TOO_MANY_KEYS:          return "TooManyKeys";
        default:                                               return "Unknown";
    }
}
//-------------------------------------------------------------------------------------------------------------------
multisig_address_error::multisig_address_error(const MultisigAddressErrorCode error_code,
    const std::string &message) :
        std::runtime_error{std::string{error_code_name(error_code)} + ": " + message},
        m_error_code{error_code}
{}
//-------------------------------------------------------------------------------------------------------------------
} //namespace msig
