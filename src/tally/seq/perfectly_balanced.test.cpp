//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#include <tally/seq/perfectly_balanced.hpp>
//
#include <tally/seq/perfectly_balanced.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tally/seq.hpp>

#include <boost/range/irange.hpp>

#include <vector>

namespace {

using tally::as_seq;
using tally::usize;
namespace seq = tally::seq;

auto is_even = [](int i) {
    return i % 2 == 0;
};

TEST(SeqPerfectlyBalancedTest, Examples)
{
    std::vector<int> three_of_four = {1, 2, 4, 6};
    std::vector<int> two_of_four = {1, 2, 3, 6};

    EXPECT_FALSE(as_seq(three_of_four) | seq::perfectly_balanced(is_even));
    EXPECT_TRUE(as_seq(two_of_four) | seq::perfectly_balanced(is_even));
}

TEST(SeqPerfectlyBalancedTest, EmptySequence)
{
    EXPECT_TRUE(as_seq(boost::irange(0, 0)) | seq::perfectly_balanced(is_even));
}

TEST(SeqPerfectlyBalancedTest, OddLengthIsNeverBalanced)
{
    // 0..6 has four evens and three odds; no predicate can split seven items in half.
    //
    EXPECT_FALSE(as_seq(boost::irange(0, 7)) | seq::perfectly_balanced(is_even));
    EXPECT_FALSE(as_seq(boost::irange(0, 7)) | seq::perfectly_balanced([](int i) {
                     return i < 3;
                 }));
    EXPECT_FALSE(as_seq(boost::irange(0, 7)) | seq::perfectly_balanced([](int i) {
                     return i < 4;
                 }));
}

TEST(SeqPerfectlyBalancedTest, AlwaysConsumesEverything)
{
    usize calls = 0;

    EXPECT_FALSE(as_seq(boost::irange(0, 10)) | seq::perfectly_balanced([&calls](int) {
                     ++calls;
                     return true;
                 }));
    EXPECT_EQ(calls, 10u);
}

TEST(SeqPerfectlyBalancedTest, HalfAndHalf)
{
    for (int len = 0; len <= 10; len += 2) {
        EXPECT_TRUE(as_seq(boost::irange(0, len)) | seq::perfectly_balanced(is_even)) << "len=" << len;
        EXPECT_TRUE(as_seq(boost::irange(0, len)) | seq::perfectly_balanced([len](int i) {
                        return i >= len / 2;
                    }))
            << "len=" << len;
    }
}

}  // namespace
