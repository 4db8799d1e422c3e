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

// Canonical serialization of a weighted multisig key set (the multisig address preimage).
// - layout: flag_multisig || threshold (u16, little endian) || { pk_i || weight_i } in input order
// - keys are not length-prefixed: key boundaries are implied by each scheme's fixed key size

#pragma once

//local headers
#include "msig_types.h"

//third party headers

//standard headers
#include <cstddef>
#include <vector>

//forward declarations


namespace msig
{

/**
* brief: multisig_address_preimage_size - get the exact size of a multisig address preimage
* param: public_keys -
* return: preimage size in bytes
*/
std::size_t multisig_address_preimage_size(const std::vector<public_key_bytes> &public_keys);
/**
* brief: make_multisig_address_preimage - serialize a multisig key set for hashing
* param: public_keys - flagged public keys (in the order they are serialized)
* param: weights - weights[i] is serialized after public_keys[i]
* param: threshold -
* outparam: preimage_out - the serialized key set
* throw: multisig_address_error (LENGTH_MISMATCH)
*/
void make_multisig_address_preimage(const std::vector<public_key_bytes> &public_keys,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold,
    std::vector<unsigned char> &preimage_out);

} //namespace msig
