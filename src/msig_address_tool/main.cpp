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

// Command-line front end for multisig address derivation and key order recovery.

//local headers
#include "misc_log_ex.h"
#include "msig_core/key_address_utils.h"
#include "msig_core/msig_types.h"
#include "msig_core/multisig_address_errors.h"
#include "msig_impl/multisig_entrypoints.h"

//third party headers
#include <boost/program_options.hpp>

//standard headers
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "msig.tool"

namespace po = boost::program_options;

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool parse_public_keys(const std::vector<std::string> &public_keys_hex,
    std::vector<msig::public_key_bytes> &public_keys_out)
{
    public_keys_out.clear();
    public_keys_out.reserve(public_keys_hex.size());

    for (const std::string &public_key_hex : public_keys_hex)
    {
        public_keys_out.emplace_back();
        if (!msig::try_public_key_from_hex(public_key_hex, public_keys_out.back()))
        {
            std::cerr << "Invalid hex public key: " << public_key_hex << std::endl;
            return false;
        }
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool parse_weights(const std::vector<unsigned int> &weights_in, std::vector<msig::multisig_weight_t> &weights_out)
{
    weights_out.clear();
    weights_out.reserve(weights_in.size());

    for (const unsigned int weight : weights_in)
    {
        if (weight > std::numeric_limits<msig::multisig_weight_t>::max())
        {
            std::cerr << "Weight out of range (0-255): " << weight << std::endl;
            return false;
        }

        weights_out.emplace_back(static_cast<msig::multisig_weight_t>(weight));
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static int run_single_key(const std::string &scheme_name, const std::vector<msig::public_key_bytes> &public_keys)
{
    msig::SignatureScheme scheme;
    if (!msig::try_scheme_from_name(scheme_name, scheme) || scheme == msig::SignatureScheme::MULTISIG)
    {
        std::cerr << "Unknown key scheme: " << scheme_name << " (expected ed25519, secp256k1 or secp256r1)" << std::endl;
        return 1;
    }
    if (public_keys.size() != 1)
    {
        std::cerr << "Exactly one --pk is required with --key-scheme" << std::endl;
        return 1;
    }

    std::cout << "0x" << msig::address_to_hex(msig::address_from_key(public_keys[0], scheme)) << std::endl;
    return 0;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static int run_multisig(const std::vector<msig::public_key_bytes> &public_keys,
    const std::vector<msig::multisig_weight_t> &weights,
    const msig::multisig_threshold_t threshold,
    const std::string &expected_address_hex)
{
    // derive mode
    if (expected_address_hex.empty())
    {
        const msig::address_t multisig_address{
                msig::entrypoints::derive_multisig_address_quiet(public_keys, weights, threshold)
            };
        std::cout << "0x" << msig::address_to_hex(multisig_address) << std::endl;
        return 0;
    }

    // order recovery mode
    msig::address_t expected_address;
    if (!msig::try_address_from_hex(expected_address_hex, expected_address))
    {
        std::cerr << "Invalid hex address: " << expected_address_hex << std::endl;
        return 1;
    }

    const std::vector<msig::public_key_bytes> ordered_public_keys{
            msig::entrypoints::order_pks(expected_address, public_keys, weights, threshold)
        };

    for (const msig::public_key_bytes &public_key : ordered_public_keys)
        std::cout << msig::public_key_to_hex(public_key) << std::endl;

    return 0;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
int main(int argc, char** argv)
{
    TRY_ENTRY();

    po::options_description desc_options("Command line options");
    desc_options.add_options()
        ("help,h", "Print this help message")
        ("pk", po::value<std::vector<std::string>>()->composing(), "Flagged public key in hex (repeat once per signer)")
        ("weight", po::value<std::vector<unsigned int>>()->composing(), "Signer weight (repeat once per signer, in --pk order)")
        ("threshold", po::value<unsigned int>(), "Multisig threshold")
        ("expected-address", po::value<std::string>()->default_value(""),
            "Multisig address to reproduce; prints the key order that derives it")
        ("key-scheme", po::value<std::string>()->default_value(""),
            "Derive a single-key address instead (ed25519, secp256k1, secp256r1)")
        ("log-level", po::value<int>()->default_value(0), "Log level (0-4)");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc_options), vm);
        po::notify(vm);
    }
    catch (const po::error &e)
    {
        std::cerr << "Failed to parse arguments: " << e.what() << std::endl;
        std::cerr << desc_options << std::endl;
        return 1;
    }

    if (vm.count("help"))
    {
        std::cout << desc_options << std::endl;
        return 0;
    }

    mlog_configure(mlog_get_default_log_path("msig-address-tool.log"), true);
    mlog_set_log_level(vm["log-level"].as<int>());

    std::vector<msig::public_key_bytes> public_keys;
    if (!parse_public_keys(vm.count("pk") ? vm["pk"].as<std::vector<std::string>>() : std::vector<std::string>{},
            public_keys))
        return 1;

    try
    {
        const std::string key_scheme{vm["key-scheme"].as<std::string>()};
        if (!key_scheme.empty())
            return run_single_key(key_scheme, public_keys);

        std::vector<msig::multisig_weight_t> weights;
        if (!parse_weights(vm.count("weight") ? vm["weight"].as<std::vector<unsigned int>>() : std::vector<unsigned int>{},
                weights))
            return 1;

        if (!vm.count("threshold"))
        {
            std::cerr << "--threshold is required for multisig addresses" << std::endl;
            return 1;
        }
        const unsigned int threshold{vm["threshold"].as<unsigned int>()};
        if (threshold > std::numeric_limits<msig::multisig_threshold_t>::max())
        {
            std::cerr << "Threshold out of range (0-65535): " << threshold << std::endl;
            return 1;
        }

        return run_multisig(public_keys,
            weights,
            static_cast<msig::multisig_threshold_t>(threshold),
            vm["expected-address"].as<std::string>());
    }
    catch (const msig::multisig_address_error &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    CATCH_ENTRY_L0("main", 1);
}
