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

// NOT FOR PRODUCTION

// Mock-up of the environment that invokes multisig address operations.

#pragma once

//local headers
#include "msig_core/msig_types.h"
#include "msig_core/multisig_address_event.h"
#include "msig_core/multisig_host_context.h"

//third party headers

//standard headers
#include <vector>

//forward declarations


namespace msig
{
namespace mocks
{

class MultisigHostContextMock final : public MultisigHostContext
{
public:
//constructors
    explicit MultisigHostContextMock(const address_t &caller_address) :
        m_caller_address{caller_address}
    {}

//overloaded operators
    /// disable copy/move (events are recorded per context)
    MultisigHostContextMock& operator=(MultisigHostContextMock&&) = delete;

//member functions
    /**
    * brief: caller_address - get the mock caller's address
    * return: caller address
    */
    const address_t& caller_address() const override { return m_caller_address; }
    /**
    * brief: emit_multisig_address_event - record an event in the mock event log
    * param: event -
    */
    void emit_multisig_address_event(const MultisigAddressEvent &event) override
    {
        m_events.emplace_back(event);
    }

    /// set the address of the next caller
    void set_caller_address(const address_t &caller_address) { m_caller_address = caller_address; }
    /// get all events emitted so far
    const std::vector<MultisigAddressEvent>& events() const { return m_events; }
    /// forget all emitted events
    void clear_events() { m_events.clear(); }

//member variables
private:
    address_t m_caller_address;
    std::vector<MultisigAddressEvent> m_events;
};

} //namespace mocks
} //namespace msig
