//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#include <tally/seq/at_most.hpp>
//
#include <tally/seq/at_most.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tally/assert.hpp>
#include <tally/seq.hpp>

#include <boost/range/irange.hpp>

#include <limits>
#include <memory>
#include <utility>
#include <vector>

namespace {

using tally::as_seq;
using tally::usize;
namespace seq = tally::seq;

auto is_two = [](int i) {
    return i == 2;
};

TEST(SeqAtMostTest, Examples)
{
    std::vector<int> three_twos = {2, 3, 2, 4, 2, 5};

    EXPECT_FALSE(as_seq(three_twos) | seq::at_most(2, is_two));
    EXPECT_TRUE(as_seq(three_twos) | seq::at_most(3, is_two));
    EXPECT_TRUE(as_seq(three_twos) | seq::at_most(4, is_two));
    EXPECT_FALSE(as_seq(three_twos) | seq::at_most(0, is_two));
}

TEST(SeqAtMostTest, EmptySequence)
{
    EXPECT_TRUE(as_seq(boost::irange(0, 0)) | seq::at_most(0, is_two));
    EXPECT_TRUE(as_seq(boost::irange(0, 0)) | seq::at_most(7, is_two));
}

TEST(SeqAtMostTest, StopsAtFirstExtraMatch)
{
    std::vector<int> nums = {2, 3, 2, 4, 2, 5, 2, 2};
    usize calls = 0;

    EXPECT_FALSE(as_seq(nums) | seq::at_most(1, [&calls](int i) {
                     ++calls;
                     return i == 2;
                 }));

    // The second 2 (one more than allowed) is at index 2.
    //
    EXPECT_EQ(calls, 3u);
}

TEST(SeqAtMostTest, TraversesEverythingWhenWithinLimit)
{
    usize calls = 0;

    EXPECT_TRUE(as_seq(boost::irange(0, 20)) | seq::at_most(4, [&calls](int i) {
                    ++calls;
                    return i % 5 == 0;
                }));
    EXPECT_EQ(calls, 20u);
}

TEST(SeqAtMostTest, MaxThresholdIsAlwaysTrue)
{
    usize calls = 0;

    EXPECT_TRUE(as_seq(boost::irange(0, 10)) | seq::at_most(std::numeric_limits<usize>::max(), [&calls](int) {
                    ++calls;
                    return true;
                }));
    EXPECT_EQ(calls, 0u);
}

// at_least and at_most agree exactly when the match count equals the threshold.
//
TEST(SeqAtMostTest, MoveOnlyPredicate)
{
    auto divisor = std::make_unique<int>(4);

    EXPECT_TRUE(as_seq(boost::irange(0, 10)) | seq::at_most(3, [d = std::move(divisor)](int i) {
                    return i % *d == 0;
                }));
}

TEST(SeqAtMostTest, ComplementsAtLeast)
{
    auto is_odd = [](int i) {
        return i % 2 == 1;
    };

    for (usize n = 0; n < 12; ++n) {
        const bool least = as_seq(boost::irange(0, 10)) | seq::at_least(n, is_odd);
        const bool most = as_seq(boost::irange(0, 10)) | seq::at_most(n, is_odd);

        EXPECT_EQ(most, n >= 5) << TALLY_INSPECT(n);
        EXPECT_EQ(least && most, n == 5) << TALLY_INSPECT(n);
        EXPECT_TRUE(least || most) << TALLY_INSPECT(n);
    }
}

}  // namespace
