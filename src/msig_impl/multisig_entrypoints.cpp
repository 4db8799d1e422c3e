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
#include "multisig_entrypoints.h"

//local headers
#include "msig_core/key_address_utils.h"
#include "msig_core/multisig_address.h"
#include "msig_core/multisig_host_context.h"
#include "msig_core/multisig_order_resolver.h"

//third party headers

//standard headers
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig"

namespace msig
{
namespace entrypoints
{
//-------------------------------------------------------------------------------------------------------------------
address_t ed25519_key_to_address(const public_key_bytes &pk)
{
    return msig::ed25519_key_to_address(pk);
}
//-------------------------------------------------------------------------------------------------------------------
address_t secp256k1_key_to_address(const public_key_bytes &pk)
{
    return msig::secp256k1_key_to_address(pk);
}
//-------------------------------------------------------------------------------------------------------------------
address_t secp256r1_key_to_address(const public_key_bytes &pk)
{
    return msig::secp256r1_key_to_address(pk);
}
//-------------------------------------------------------------------------------------------------------------------
address_t derive_multisig_address_quiet(const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold)
{
    return make_multisig_address(MultisigSpec{pks, weights, threshold});
}
//-------------------------------------------------------------------------------------------------------------------
address_t derive_multisig_address(MultisigHostContext &host_context,
    const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold)
{
    return make_multisig_address_and_emit(MultisigSpec{pks, weights, threshold}, host_context);
}
//-------------------------------------------------------------------------------------------------------------------
bool check_multisig_address_eq(const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold,
    const address_t &expected_address)
{
    return multisig_address_equals(MultisigSpec{pks, weights, threshold}, expected_address);
}
//-------------------------------------------------------------------------------------------------------------------
bool check_if_sender_is_multisig_address(const MultisigHostContext &host_context,
    const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold)
{
    return sender_is_multisig_address(MultisigSpec{pks, weights, threshold}, host_context);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<public_key_bytes> order_pks(const address_t &expected_address,
    const std::vector<public_key_bytes> &pks,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold)
{
    return msig::order_pks(expected_address, pks, weights, threshold);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace entrypoints
} //namespace msig
