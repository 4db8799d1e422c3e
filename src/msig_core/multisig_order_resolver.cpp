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
#include "multisig_order_resolver.h"

//local headers
#include "misc_log_ex.h"
#include "msig_config.h"
#include "multisig_address.h"
#include "multisig_address_errors.h"
#include "permutation_generator.h"

//third party headers

//standard headers
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig"

namespace msig
{
//-------------------------------------------------------------------------------------------------------------------
bool try_order_pks(const address_t &expected_address,
    const std::vector<public_key_bytes> &public_keys,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold,
    std::vector<public_key_bytes> &ordered_public_keys_out)
{
    MSIG_CHECK_AND_THROW(public_keys.size() <= config::MSIG_MAX_ORDER_PKS_SIGNERS,
        MultisigAddressErrorCode::TOO_MANY_KEYS,
        "order pks: " << public_keys.size() << " keys exceeds the limit of "
            << config::MSIG_MAX_ORDER_PKS_SIGNERS);

    // validate once up front (every candidate has the same weights and threshold)
    MultisigSpec candidate_spec{public_keys, weights, threshold};
    MSIG_CHECK_AND_THROW(public_keys.size() == weights.size(),
        MultisigAddressErrorCode::LENGTH_MISMATCH,
        "order pks: " << public_keys.size() << " keys but " << weights.size() << " weights");
    MSIG_CHECK_AND_THROW(validate_multisig_spec(candidate_spec),
        MultisigAddressErrorCode::INVALID_THRESHOLD,
        "order pks: threshold " << threshold << " is zero or exceeds the weight sum "
            << multisig_weight_sum(weights));

    // test each key ordering against the expected address
    PermutationGenerator<public_key_bytes> generator{public_keys};
    do
    {
        candidate_spec.public_keys = generator.current();

        if (make_multisig_address(candidate_spec) == expected_address)
        {
            MDEBUG("order pks: matched " << address_to_hex(expected_address) << " after "
                << generator.num_emitted() << " of " << num_permutations(public_keys.size()) << " orderings.");

            ordered_public_keys_out = std::move(candidate_spec.public_keys);
            return true;
        }
    } while (generator.next());

    return false;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<public_key_bytes> order_pks(const address_t &expected_address,
    const std::vector<public_key_bytes> &public_keys,
    const std::vector<multisig_weight_t> &weights,
    const multisig_threshold_t threshold)
{
    std::vector<public_key_bytes> ordered_public_keys;

    MSIG_CHECK_AND_THROW(try_order_pks(expected_address, public_keys, weights, threshold, ordered_public_keys),
        MultisigAddressErrorCode::NO_PERMUTATION_MATCHES,
        "order pks: no ordering of " << public_keys.size() << " keys derives "
            << address_to_hex(expected_address));

    return ordered_public_keys;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace msig
