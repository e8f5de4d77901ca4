//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_COUNT_MATCHES_HPP
#define TALLY_SEQ_COUNT_MATCHES_HPP

#include <tally/config.hpp>
//
#include <tally/seq/for_each.hpp>
#include <tally/seq/requirements.hpp>

#include <tally/int_types.hpp>
#include <tally/utility.hpp>

#include <limits>
#include <type_traits>

namespace tally {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// count_matches(predicate, limit)
//
// The number of items that satisfy `predicate`, counting no higher than `limit`.  The pull that yields the
// limit-th match is the last one; `limit == 0` pulls nothing.  The predicate sees every pulled item once.
//
template <typename Predicate>
struct CountMatchesBinder {
    Predicate predicate;
    usize limit;
};

template <typename Predicate>
inline CountMatchesBinder<std::decay_t<Predicate>> count_matches(
    Predicate&& predicate, usize limit = std::numeric_limits<usize>::max())
{
    return {TALLY_FORWARD(predicate), limit};
}

template <typename Seq, typename Predicate, typename = EnableIfSeq<Seq>>
[[nodiscard]] usize operator|(Seq&& seq, CountMatchesBinder<Predicate>&& binder)
{
    static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                  "(seq::count_matches) Sequences may not be captured implicitly by reference.");

    usize matched = 0;
    if (binder.limit == 0) {
        return matched;
    }

    TALLY_FORWARD(seq) | for_each([&](auto&& item) {
        if (binder.predicate(item) && TALLY_HINT_FALSE(++matched == binder.limit)) {
            return kBreak;
        }
        return kContinue;
    });

    return matched;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_COUNT_MATCHES_HPP
