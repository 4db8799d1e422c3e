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

// Host-facing multisig address operations.
// - every operation is atomic: on error it throws msig::multisig_address_error and has no effects

#pragma once

//local headers
#include "msig_core/msig_types.h"

//third party headers

//standard headers
#include <vector>

//forward declarations
namespace msig { class MultisigHostContext; }


namespace msig
{
namespace entrypoints
{

/// address of a single flagged key (ed25519: 33 bytes, flag 0x00)
address_t ed25519_key_to_address(const public_key_bytes &pk);
/// address of a single flagged key (secp256k1: 34 bytes, flag 0x01)
address_t secp256k1_key_to_address(const public_key_bytes &pk);
/// address of a single flagged key (secp256r1: 34 bytes, flag 0x02)
address_t secp256r1_key_to_address(const public_key_bytes &pk);

/// derive a multisig address without emitting an event
address_t derive_multisig_address_quiet(const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold);
/// derive a multisig address and emit a MultisigAddressEvent to the host
address_t derive_multisig_address(MultisigHostContext &host_context,
    const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold);
/// check if a multisig key set derives an expected address
bool check_multisig_address_eq(const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold,
    const address_t &expected_address);
/// check if the host's current caller is the address of a multisig key set
bool check_if_sender_is_multisig_address(const MultisigHostContext &host_context,
    const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold);
/// find the key ordering that derives an expected multisig address
std::vector<public_key_bytes> order_pks(const address_t &expected_address,
    const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold);

} //namespace entrypoints
} //namespace msig
