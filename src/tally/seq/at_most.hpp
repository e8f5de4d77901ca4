//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_AT_MOST_HPP
#define TALLY_SEQ_AT_MOST_HPP

#include <tally/config.hpp>
//
#include <tally/seq/count_matches.hpp>
#include <tally/seq/requirements.hpp>

#include <tally/int_types.hpp>
#include <tally/utility.hpp>

#include <limits>
#include <type_traits>
#include <utility>

namespace tally {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// at_most(n, predicate)
//
// True iff no more than `n` items of the sequence satisfy `predicate`.  Pulling stops at the (n+1)-th
// match, so only a sequence with at most `n` matches is traversed to the end.
//
template <typename Predicate>
struct AtMostBinder {
    usize n;
    Predicate predicate;
};

template <typename Predicate>
inline AtMostBinder<std::decay_t<Predicate>> at_most(usize n, Predicate&& predicate)
{
    return {n, TALLY_FORWARD(predicate)};
}

template <typename Seq, typename Predicate, typename = EnableIfSeq<Seq>>
[[nodiscard]] bool operator|(Seq&& seq, AtMostBinder<Predicate>&& binder)
{
    static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                  "(seq::at_most) Sequences may not be captured implicitly by reference.");

    // No sequence can have more matches than this; also keeps `n + 1` from wrapping to zero below.
    //
    if (binder.n == std::numeric_limits<usize>::max()) {
        return true;
    }

    return (TALLY_FORWARD(seq) | count_matches(std::move(binder.predicate), binder.n + 1)) <= binder.n;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_AT_MOST_HPP
