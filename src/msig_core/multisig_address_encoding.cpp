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
#include "multisig_address_encoding.h"

//local headers
#include "misc_log_ex.h"
#include "msig_config.h"
#include "multisig_address_errors.h"

//third party headers

//standard headers
#include <cstddef>
#include <cstdint>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig"

namespace msig
{
//-------------------------------------------------------------------------------------------------------------------
// append a u16 as a fixed 2-byte little-endian integer
//-------------------------------------------------------------------------------------------------------------------
static void append_uint16_le(const std::uint16_t value, std::vector<unsigned char> &bytes_inout)
{
    static_assert(config::MSIG_THRESHOLD_SERIALIZED_SIZE == 2, "");

    bytes_inout.emplace_back(static_cast<unsigned char>(value & 0xFF));
    bytes_inout.emplace_back(static_cast<unsigned char>((value >> 8) & 0xFF));
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
std::size_t multisig_address_preimage_size(const std::vector<public_key_bytes> &public_keys)
{
    // flag || threshold || {pk || weight}
    std::size_t preimage_size{1 + config::MSIG_THRESHOLD_SERIALIZED_SIZE};

    for (const public_key_bytes &public_key : public_keys)
        preimage_size += public_key.size() + sizeof(multisig_weight_t);

    return preimage_size;
}
//-------------------------------------------------------------------------------------------------------------------
void make_multisig_address_preimage(const std::vector<public_key_bytes> &public_keys,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold,
    std::vector<unsigned char> &preimage_out)
{
    MSIG_CHECK_AND_THROW(public_keys.size() == weights.size(),
        MultisigAddressErrorCode::LENGTH_MISMATCH,
        "multisig address preimage: " << public_keys.size() << " keys but " << weights.size() << " weights");

    preimage_out.clear();
    preimage_out.reserve(multisig_address_preimage_size(public_keys));

    // 1. multisig flag
    preimage_out.emplace_back(config::MSIG_FLAG_MULTISIG);

    // 2. threshold
    append_uint16_le(threshold, preimage_out);

    // 3. {pk || weight} pairs in input order
    for (std::size_t signer_index{0}; signer_index < public_keys.size(); ++signer_index)
    {
        preimage_out.insert(preimage_out.end(), public_keys[signer_index].begin(), public_keys[signer_index].end());
        preimage_out.emplace_back(weights[signer_index]);
    }

    // sanity check
    CHECK_AND_ASSERT_THROW_MES(preimage_out.size() == multisig_address_preimage_size(public_keys),
        "multisig address preimage: unexpected preimage size (bug).");
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace msig
