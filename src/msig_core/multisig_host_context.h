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

// Interface to the environment that invokes multisig address operations (e.g. a ledger executing a call).

#pragma once

//local headers
#include "msig_types.h"
#include "multisig_address_event.h"

//third party headers

//standard headers

//forward declarations


namespace msig
{

class MultisigHostContext
{
public:
//destructor
    virtual ~MultisigHostContext() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    MultisigHostContext& operator=(MultisigHostContext&&) = delete;

//member functions
    /**
    * brief: caller_address - get the address of the principal invoking the current call
    * return: caller address
    */
    virtual const address_t& caller_address() const = 0;
    /**
    * brief: emit_multisig_address_event - record an audit event for the current call
    * param: event -
    */
    virtual void emit_multisig_address_event(const MultisigAddressEvent &event) = 0;
};

} //namespace msig
