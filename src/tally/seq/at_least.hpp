//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_AT_LEAST_HPP
#define TALLY_SEQ_AT_LEAST_HPP

#include <tally/config.hpp>
//
#include <tally/seq/count_matches.hpp>
#include <tally/seq/requirements.hpp>

#include <tally/int_types.hpp>
#include <tally/utility.hpp>

#include <type_traits>
#include <utility>

namespace tally {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// at_least(n, predicate)
//
// True iff at least `n` items of the sequence satisfy `predicate`.  Pulling stops as soon as the n-th match
// is found; `at_least(0, ...)` is true without pulling anything.
//
template <typename Predicate>
struct AtLeastBinder {
    usize n;
    Predicate predicate;
};

template <typename Predicate>
inline AtLeastBinder<std::decay_t<Predicate>> at_least(usize n, Predicate&& predicate)
{
    return {n, TALLY_FORWARD(predicate)};
}

template <typename Seq, typename Predicate, typename = EnableIfSeq<Seq>>
[[nodiscard]] bool operator|(Seq&& seq, AtLeastBinder<Predicate>&& binder)
{
    static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                  "(seq::at_least) Sequences may not be captured implicitly by reference.");

    return (TALLY_FORWARD(seq) | count_matches(std::move(binder.predicate), binder.n)) == binder.n;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_AT_LEAST_HPP
