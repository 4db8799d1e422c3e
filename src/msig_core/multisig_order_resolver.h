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

// Recover the key order of a multisig key set from its address.
// - only the keys are permuted: weights and threshold keep their positions, so weights[i] is paired with
//   whichever key occupies position i in a candidate ordering
// - candidates are tested in PermutationGenerator order and the first match is returned

#pragma once

//local headers
#include "msig_types.h"

//third party headers

//standard headers
#include <vector>

//forward declarations


namespace msig
{

/**
* brief: try_order_pks - find the ordering of a key set that derives an expected multisig address
* param: expected_address - multisig address to reproduce
* param: public_keys - flagged public keys in arbitrary order
* param: weights - weights in multisig order
* param: threshold -
* outparam: ordered_public_keys_out - the first ordering of 'public_keys' that derives 'expected_address'
* return: false if no ordering derives the expected address
* throw: multisig_address_error (LENGTH_MISMATCH, INVALID_THRESHOLD, TOO_MANY_KEYS)
*/
bool try_order_pks(const address_t &expected_address,
    const std::vector<public_key_bytes> &public_keys,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold,
    std::vector<public_key_bytes> &ordered_public_keys_out);
/**
* brief: order_pks - find the ordering of a key set that derives an expected multisig address
* param: expected_address - multisig address to reproduce
* param: public_keys - flagged public keys in arbitrary order
* param: weights - weights in multisig order
* param: threshold -
* return: the first ordering of 'public_keys' that derives 'expected_address'
* throw: multisig_address_error (LENGTH_MISMATCH, INVALID_THRESHOLD, TOO_MANY_KEYS, NO_PERMUTATION_MATCHES)
*/
std::vector<public_key_bytes> order_pks(const address_t &expected_address,
    const std::vector<public_key_bytes> &public_keys,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold);

} //namespace msig
