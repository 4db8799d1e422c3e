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

// Errors reported while deriving multisig addresses or resolving multisig key order.

#pragma once

//local headers
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <sstream>
#include <stdexcept>
#include <string>

//forward declarations


namespace msig
{

enum class MultisigAddressErrorCode
{
    /// the number of keys does not match the number of weights
    LENGTH_MISMATCH,
    /// threshold is zero or exceeds the sum of weights
    INVALID_THRESHOLD,
    /// a flagged public key has the wrong size for its scheme
    INVALID_KEY_LENGTH,
    /// a flagged public key has the wrong scheme flag
    INVALID_KEY_FLAG,
    /// no ordering of the keys reproduces the expected address
    NO_PERMUTATION_MATCHES,
    /// too many keys to search for an ordering
    TOO_MANY_KEYS
};

/// name of an error code (e.g. "NoPermutationMatches")
const char* error_code_name(const MultisigAddressErrorCode error_code);

////
// multisig_address_error
// - a failed call has no effects (no address, no event)
///
class multisig_address_error final : public std::runtime_error
{
public:
//constructors
    multisig_address_error(const MultisigAddressErrorCode error_code, const std::string &message);

//member functions
    MultisigAddressErrorCode error_code() const { return m_error_code; }

//member variables
private:
    MultisigAddressErrorCode m_error_code;
};

} //namespace msig

/// log and throw a multisig_address_error if 'expr' is false ('message' may be a stream expression)
#define MSIG_CHECK_AND_THROW(expr, code, message)                                      \
    do {                                                                               \
        if (!(expr))                                                                   \
        {                                                                              \
            std::ostringstream msig_error_stream;                                      \
            msig_error_stream << message;                                              \
            MERROR(msig::error_code_name(code) << ": " << msig_error_stream.str());    \
            throw msig::multisig_address_error{code, msig_error_stream.str()};         \
        }                                                                              \
    } while (0)
