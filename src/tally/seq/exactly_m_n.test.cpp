//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#include <tally/seq/exactly_m_n.hpp>
//
#include <tally/seq/exactly_m_n.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tally/seq.hpp>

#include <boost/range/irange.hpp>

#include <cctype>
#include <string>
#include <vector>

namespace {

using tally::as_seq;
using tally::usize;
namespace seq = tally::seq;

auto is_alpha = [](char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
};

auto is_digit = [](char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
};

TEST(SeqExactlyMNTest, LettersAndDigits)
{
    std::string s = "abcd1234";

    EXPECT_TRUE(as_seq(s) | seq::exactly_m_n(4, is_alpha, 4, is_digit));
    EXPECT_FALSE(as_seq(s) | seq::exactly_m_n(4, is_alpha, 3, is_digit));
    EXPECT_FALSE(as_seq(s) | seq::exactly_m_n(5, is_alpha, 4, is_digit));
    EXPECT_FALSE(as_seq(s) | seq::exactly_m_n(3, is_alpha, 4, is_digit));
}

TEST(SeqExactlyMNTest, EmptySequence)
{
    std::string s;

    EXPECT_TRUE(as_seq(s) | seq::exactly_m_n(0, is_alpha, 0, is_digit));
    EXPECT_FALSE(as_seq(s) | seq::exactly_m_n(0, is_alpha, 1, is_digit));
    EXPECT_FALSE(as_seq(s) | seq::exactly_m_n(1, is_alpha, 0, is_digit));
}

TEST(SeqExactlyMNTest, OverlappingPredicates)
{
    // Multiples of 2: 0 2 4 6 8 10; multiples of 3: 0 3 6 9.
    //
    auto is_even = [](int i) {
        return i % 2 == 0;
    };
    auto is_triple = [](int i) {
        return i % 3 == 0;
    };

    EXPECT_TRUE(as_seq(boost::irange(0, 11)) | seq::exactly_m_n(6, is_even, 4, is_triple));
    EXPECT_FALSE(as_seq(boost::irange(0, 11)) | seq::exactly_m_n(6, is_even, 3, is_triple));
}

TEST(SeqExactlyMNTest, BothPredicatesSeeEveryItemInOrder)
{
    std::string s = "ab12";
    std::string log;

    EXPECT_TRUE(as_seq(s) | seq::exactly_m_n(
                                2,
                                [&log](char ch) {
                                    log += 'm';
                                    log += ch;
                                    return is_alpha(ch);
                                },
                                2,
                                [&log](char ch) {
                                    log += 'n';
                                    log += ch;
                                    return is_digit(ch);
                                }));

    EXPECT_EQ(log, "manambnbm1n1m2n2");
}

TEST(SeqExactlyMNTest, FailsFastWhenEitherCountGoesOver)
{
    std::string s = "a1b2c3d4";
    usize m_calls = 0;
    usize n_calls = 0;

    EXPECT_FALSE(as_seq(s) | seq::exactly_m_n(
                                 4,
                                 [&m_calls](char ch) {
                                     ++m_calls;
                                     return is_alpha(ch);
                                 },
                                 1,
                                 [&n_calls](char ch) {
                                     ++n_calls;
                                     return is_digit(ch);
                                 }));

    // The second digit is at index 3; both predicates were applied to it and nothing after.
    //
    EXPECT_EQ(m_calls, 4u);
    EXPECT_EQ(n_calls, 4u);
}

TEST(SeqExactlyMNTest, ZeroThresholdFailsOnFirstMatch)
{
    std::string s = "xyz9abc";
    usize calls = 0;

    EXPECT_FALSE(as_seq(s) | seq::exactly_m_n(
                                 3, is_alpha, 0,
                                 [&calls](char ch) {
                                     ++calls;
                                     return is_digit(ch);
                                 }));
    EXPECT_EQ(calls, 4u);
}

}  // namespace
