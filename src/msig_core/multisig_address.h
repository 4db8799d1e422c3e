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

// Weighted multisig address derivation.
// - multisig address = H_32(flag_multisig || threshold || {pk_i || weight_i})
// - the key order is part of the address

#pragma once

//local headers
#include "msig_types.h"

//third party headers

//standard headers
#include <cstdint>
#include <vector>

//forward declarations
namespace msig { class MultisigHostContext; }


namespace msig
{

/**
* brief: multisig_weight_sum - sum of multisig weights, saturated at the max threshold value
*   - saturation preserves 'threshold <= sum' for every representable threshold
* param: weights -
* return: min(sum(weights), max threshold)
*/
std::uint32_t multisig_weight_sum(const std::vector<multisig_weight_t> &weights);
/**
* brief: validate_multisig_spec - check the shape of a multisig key set (keys are not inspected)
*   - check: one weight per key
*   - check: 0 < threshold <= sum(weights)
* param: multisig_spec -
* return: true/false on validation result
*/
bool validate_multisig_spec(const MultisigSpec &multisig_spec);
/**
* brief: make_multisig_address - derive the address of a multisig key set
* param: multisig_spec - keys (ordered), weights, threshold
* return: multisig address
* throw: multisig_address_error (LENGTH_MISMATCH, INVALID_THRESHOLD)
*/
address_t make_multisig_address(const MultisigSpec &multisig_spec);
/**
* brief: make_multisig_address_and_emit - derive the address of a multisig key set and record an audit event
*   - returns the same address as make_multisig_address()
*   - exactly one event is emitted on success, none on failure
* param: multisig_spec - keys (ordered), weights, threshold
* inoutparam: host_context - receives the MultisigAddressEvent
* return: multisig address
* throw: multisig_address_error (LENGTH_MISMATCH, INVALID_THRESHOLD)
*/
address_t make_multisig_address_and_emit(const MultisigSpec &multisig_spec, MultisigHostContext &host_context);
/**
* brief: multisig_address_equals - check if a multisig key set derives an expected address
* param: multisig_spec -
* param: expected_address -
* return: true if make_multisig_address(multisig_spec) == expected_address
* throw: multisig_address_error (LENGTH_MISMATCH, INVALID_THRESHOLD)
*/
bool multisig_address_equals(const MultisigSpec &multisig_spec, const address_t &expected_address);
/**
* brief: sender_is_multisig_address - check if the caller of the current call is a multisig key set's address
* param: multisig_spec -
* param: host_context - provides the caller address
* return: true if make_multisig_address(multisig_spec) == caller address
* throw: multisig_address_error (LENGTH_MISMATCH, INVALID_THRESHOLD)
*/
bool sender_is_multisig_address(const MultisigSpec &multisig_spec, const MultisigHostContext &host_context);

} //namespace msig
