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
#include "msig_hash_functions.h"

//local headers
#include "misc_log_ex.h"
#include "msig_config.h"

//third party headers
#include <sodium/crypto_generichash.h>

//standard headers
#include <cstddef>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig.crypto"

namespace msig
{

static_assert(config::MSIG_ADDRESS_SIZE >= crypto_generichash_BYTES_MIN &&
        config::MSIG_ADDRESS_SIZE <= crypto_generichash_BYTES_MAX,
    "address size is not a valid blake2b digest length.");

//-------------------------------------------------------------------------------------------------------------------
void msig_hash_to_32(const void *data, const std::size_t data_length, unsigned char *hash_out)
{
    // H_32(x): blake2b with 32-byte output, no key
    CHECK_AND_ASSERT_THROW_MES(crypto_generichash(hash_out,
                config::MSIG_ADDRESS_SIZE,
                reinterpret_cast<const unsigned char*>(data),
                data_length,
                nullptr,
                0) == 0,
        "msig hash to 32: blake2b failed.");
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace msig
