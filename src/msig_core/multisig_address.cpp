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
#include "multisig_address.h"

//local headers
#include "misc_log_ex.h"
#include "msig_crypto/math_utils.h"
#include "msig_crypto/msig_hash_functions.h"
#include "multisig_address_encoding.h"
#include "multisig_address_errors.h"
#include "multisig_address_event.h"
#include "multisig_host_context.h"

//third party headers

//standard headers
#include <cstdint>
#include <limits>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig"

namespace msig
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void check_multisig_spec_semantics(const MultisigSpec &multisig_spec)
{
    MSIG_CHECK_AND_THROW(multisig_spec.public_keys.size() == multisig_spec.weights.size(),
        MultisigAddressErrorCode::LENGTH_MISMATCH,
        "multisig spec has " << multisig_spec.public_keys.size() << " keys but "
            << multisig_spec.weights.size() << " weights");
    MSIG_CHECK_AND_THROW(multisig_spec.threshold > 0,
        MultisigAddressErrorCode::INVALID_THRESHOLD,
        "multisig threshold is zero");
    MSIG_CHECK_AND_THROW(multisig_spec.threshold <= multisig_weight_sum(multisig_spec.weights),
        MultisigAddressErrorCode::INVALID_THRESHOLD,
        "multisig threshold " << multisig_spec.threshold << " exceeds the weight sum "
            << multisig_weight_sum(multisig_spec.weights));
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
std::uint32_t multisig_weight_sum(const std::vector<multisig_weight_t> &weights)
{
    std::uint64_t weight_sum{0};

    for (const multisig_weight_t weight : weights)
        weight_sum = math::saturating_add(weight_sum, weight, std::numeric_limits<multisig_threshold_t>::max());

    return static_cast<std::uint32_t>(weight_sum);
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_multisig_spec(const MultisigSpec &multisig_spec)
{
    if (multisig_spec.public_keys.size() != multisig_spec.weights.size())
        return false;
    if (multisig_spec.threshold == 0)
        return false;
    if (multisig_spec.threshold > multisig_weight_sum(multisig_spec.weights))
        return false;

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
address_t make_multisig_address(const MultisigSpec &multisig_spec)
{
    check_multisig_spec_semantics(multisig_spec);

    // preimage: flag || threshold || {pk || weight}
    std::vector<unsigned char> preimage;
    make_multisig_address_preimage(multisig_spec.public_keys, multisig_spec.weights, multisig_spec.threshold, preimage);

    // address = H_32(preimage)
    address_t multisig_address;
    msig_hash_to_32(preimage.data(), preimage.size(), multisig_address.bytes);

    return multisig_address;
}
//-------------------------------------------------------------------------------------------------------------------
address_t make_multisig_address_and_emit(const MultisigSpec &multisig_spec, MultisigHostContext &host_context)
{
    const address_t multisig_address{make_multisig_address(multisig_spec)};

    MDEBUG("Derived multisig address " << address_to_hex(multisig_address) << " ("
        << multisig_spec.threshold << "-of-" << multisig_spec.public_keys.size() << " weighted signers).");

    host_context.emit_multisig_address_event(
            MultisigAddressEvent{
                multisig_spec.public_keys,
                multisig_spec.weights,
                multisig_spec.threshold,
                multisig_address
            }
        );

    return multisig_address;
}
//-------------------------------------------------------------------------------------------------------------------
bool multisig_address_equals(const MultisigSpec &multisig_spec, const address_t &expected_address)
{
    return make_multisig_address(multisig_spec) == expected_address;
}
//-------------------------------------------------------------------------------------------------------------------
bool sender_is_multisig_address(const MultisigSpec &multisig_spec, const MultisigHostContext &host_context)
{
    return multisig_address_equals(multisig_spec, host_context.caller_address());
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace msig
