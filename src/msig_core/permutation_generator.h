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

// Iterative enumeration of all orderings of a sequence (Heap's algorithm, no recursion).
// - the enumeration order is fixed: identity first, then one swap per step
//   - ex: [A, B, C] -> ABC, BAC, CAB, ACB, BCA, CBA
// - n elements produce exactly n! arrangements (n = 0 produces one empty arrangement)

#pragma once

//local headers
#include "misc_log_ex.h"
#include "msig_crypto/math_utils.h"

//third party headers

//standard headers
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

//forward declarations


namespace msig
{

/**
* brief: num_permutations - number of orderings of a sequence with 'num_elements' elements
* param: num_elements -
* return: num_elements!, or 0 if that does not fit in a std::uint64_t
*/
inline std::uint64_t num_permutations(const std::size_t num_elements)
{
    if (num_elements > 20)
        return 0;

    return math::factorial(static_cast<std::uint32_t>(num_elements));
}

////
// PermutationGenerator
// - lazily walks all orderings of a sequence in Heap's order
// - state: counter array 'c' (one counter per position) and a position pointer 'i'
// - usage:
//     PermutationGenerator<T> generator{elements};
//     do { use(generator.current()); } while (generator.next());
///
template <typename T>
class PermutationGenerator final
{
public:
//constructors
    explicit PermutationGenerator(std::vector<T> elements) :
        m_original{elements},
        m_current{std::move(elements)},
        m_counters(m_current.size(), 0),
        m_position{1},
        m_num_emitted{1}
    {}

//member functions
    /// the current arrangement (the identity arrangement before the first call to next())
    const std::vector<T>& current() const { return m_current; }
    /// number of arrangements produced so far, including the current one
    std::uint64_t num_emitted() const { return m_num_emitted; }
    /// true if every arrangement has been produced
    bool exhausted() const { return m_position >= m_current.size(); }

    /**
    * brief: next - advance to the next arrangement
    * return: false if there are no more arrangements (the current arrangement is unchanged)
    */
    bool next()
    {
        while (m_position < m_current.size())
        {
            if (m_counters[m_position] < m_position)
            {
                // even position: swap with the first element; odd position: swap with the counter's element
                if (m_position % 2 == 0)
                    std::swap(m_current[0], m_current[m_position]);
                else
                    std::swap(m_current[m_counters[m_position]], m_current[m_position]);

                ++m_counters[m_position];
                m_position = 1;
                ++m_num_emitted;

                return true;
            }

            m_counters[m_position] = 0;
            ++m_position;
        }

        return false;
    }

    /// restart from the identity arrangement
    void reset()
    {
        m_current = m_original;
        m_counters.assign(m_current.size(), 0);
        m_position = 1;
        m_num_emitted = 1;
    }

//member variables
private:
    /// the input arrangement
    const std::vector<T> m_original;
    /// the arrangement most recently produced
    std::vector<T> m_current;
    /// Heap's algorithm state
    std::vector<std::size_t> m_counters;
    std::size_t m_position;

    std::uint64_t m_num_emitted;
};

/**
* brief: get_permutations - get all orderings of a sequence, in PermutationGenerator order
* param: elements -
* outparam: permutations_out - num_permutations(elements.size()) arrangements, the first equal to 'elements'
*/
template <typename T>
void get_permutations(const std::vector<T> &elements, std::vector<std::vector<T>> &permutations_out)
{
    const std::uint64_t expected_num_permutations{num_permutations(elements.size())};
    CHECK_AND_ASSERT_THROW_MES(expected_num_permutations != 0,
        "get permutations: too many elements to enumerate.");

    permutations_out.clear();
    permutations_out.reserve(expected_num_permutations);

    PermutationGenerator<T> generator{elements};
    do
    {
        permutations_out.emplace_back(generator.current());
    } while (generator.next());

    // sanity check
    CHECK_AND_ASSERT_THROW_MES(permutations_out.size() == expected_num_permutations,
        "get permutations: unexpected number of permutations (bug).");
}

} //namespace msig
