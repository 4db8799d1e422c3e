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

#include "msig_core/permutation_generator.h"
#include "msig_crypto/math_utils.h"

#include "gtest/gtest.h"

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::vector<int> make_sequence(const std::size_t num_elements)
{
    std::vector<int> sequence;
    sequence.reserve(num_elements);

    for (std::size_t i{0}; i < num_elements; ++i)
        sequence.emplace_back(static_cast<int>(i));

    return sequence;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void test_permutation_completeness(const std::size_t num_elements)
{
    const std::vector<int> sequence{make_sequence(num_elements)};

    std::vector<std::vector<int>> permutations;
    ASSERT_NO_THROW(msig::get_permutations(sequence, permutations));

    // n! arrangements, identity first
    ASSERT_EQ(permutations.size(), msig::num_permutations(num_elements));
    ASSERT_EQ(permutations.front(), sequence);

    // all arrangements are distinct
    const std::set<std::vector<int>> unique_permutations{permutations.begin(), permutations.end()};
    ASSERT_EQ(unique_permutations.size(), permutations.size());

    // the arrangements are exactly the set of all orderings
    std::set<std::vector<int>> all_orderings;
    std::vector<int> ordering{sequence};
    do
    {
        all_orderings.insert(ordering);
    } while (std::next_permutation(ordering.begin(), ordering.end()));

    ASSERT_EQ(unique_permutations, all_orderings);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------

//-------------------------------------------------------------------------------------------------------------------
TEST(msig_permutations, enumeration_order)
{
    std::vector<std::vector<char>> permutations;
    msig::get_permutations(std::vector<char>{'A', 'B', 'C'}, permutations);

    std::vector<std::string> permutation_strings;
    for (const std::vector<char> &permutation : permutations)
        permutation_strings.emplace_back(permutation.begin(), permutation.end());

    const std::vector<std::string> expected{"ABC", "BAC", "CAB", "ACB", "BCA", "CBA"};
    EXPECT_EQ(permutation_strings, expected);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_permutations, enumeration_order_4)
{
    std::vector<std::vector<char>> permutations;
    msig::get_permutations(std::vector<char>{'A', 'B', 'C', 'D'}, permutations);
    ASSERT_EQ(permutations.size(), 24);

    std::vector<std::string> permutation_strings;
    for (const std::vector<char> &permutation : permutations)
        permutation_strings.emplace_back(permutation.begin(), permutation.end());

    // each step swaps exactly two positions
    const std::vector<std::string> expected{
            "ABCD", "BACD", "CABD", "ACBD", "BCAD", "CBAD",
            "DBAC", "BDAC", "ADBC", "DABC", "BADC", "ABDC",
            "ACDB", "CADB", "DACB", "ADCB", "CDAB", "DCAB",
            "DCBA", "CDBA", "BDCA", "DBCA", "CBDA", "BCDA"
        };
    EXPECT_EQ(permutation_strings, expected);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_permutations, small_inputs)
{
    // n = 0: one empty arrangement
    std::vector<std::vector<int>> permutations;
    msig::get_permutations(std::vector<int>{}, permutations);
    ASSERT_EQ(permutations.size(), 1);
    EXPECT_TRUE(permutations[0].empty());

    // n = 1: the input unchanged
    msig::get_permutations(std::vector<int>{7}, permutations);
    ASSERT_EQ(permutations.size(), 1);
    EXPECT_EQ(permutations[0], std::vector<int>{7});

    // n = 2: identity then swap
    msig::get_permutations(std::vector<int>{1, 2}, permutations);
    ASSERT_EQ(permutations.size(), 2);
    EXPECT_EQ(permutations[0], (std::vector<int>{1, 2}));
    EXPECT_EQ(permutations[1], (std::vector<int>{2, 1}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_permutations, completeness)
{
    for (std::size_t num_elements{0}; num_elements <= 7; ++num_elements)
        test_permutation_completeness(num_elements);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_permutations, duplicate_elements)
{
    // positions are permuted, not values: duplicates still produce n! arrangements
    std::vector<std::vector<int>> permutations;
    msig::get_permutations(std::vector<int>{5, 5, 6}, permutations);
    ASSERT_EQ(permutations.size(), 6);

    const std::set<std::vector<int>> unique_permutations{permutations.begin(), permutations.end()};
    EXPECT_EQ(unique_permutations.size(), 3);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_permutations, lazy_generator)
{
    const std::vector<int> sequence{make_sequence(5)};

    std::vector<std::vector<int>> materialized;
    msig::get_permutations(sequence, materialized);

    // the lazy generator walks the same sequence
    msig::PermutationGenerator<int> generator{sequence};
    EXPECT_FALSE(generator.exhausted());

    std::size_t index{0};
    do
    {
        ASSERT_LT(index, materialized.size());
        EXPECT_EQ(generator.current(), materialized[index]);
        EXPECT_EQ(generator.num_emitted(), index + 1);
        ++index;
    } while (generator.next());

    EXPECT_EQ(index, materialized.size());
    EXPECT_TRUE(generator.exhausted());

    // no more arrangements: the last one is kept
    EXPECT_FALSE(generator.next());
    EXPECT_EQ(generator.current(), materialized.back());

    // restart from the identity
    generator.reset();
    EXPECT_FALSE(generator.exhausted());
    EXPECT_EQ(generator.current(), sequence);
    EXPECT_EQ(generator.num_emitted(), 1);
    ASSERT_TRUE(generator.next());
    EXPECT_EQ(generator.current(), materialized[1]);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(msig_permutations, num_permutations)
{
    EXPECT_EQ(msig::num_permutations(0), 1);
    EXPECT_EQ(msig::num_permutations(1), 1);
    EXPECT_EQ(msig::num_permutations(3), 6);
    EXPECT_EQ(msig::num_permutations(10), 3628800);
    EXPECT_EQ(msig::num_permutations(20), 2432902008176640000ULL);
    EXPECT_EQ(msig::num_permutations(21), 0);

    EXPECT_EQ(msig::math::saturating_add(65535, 1, 65535), 65535);
    EXPECT_EQ(msig::math::saturating_add(65000, 255, 65535), 65255);
}
//-------------------------------------------------------------------------------------------------------------------
