//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_PERFECTLY_BALANCED_HPP
#define TALLY_SEQ_PERFECTLY_BALANCED_HPP

#include <tally/config.hpp>
//
#include <tally/seq/for_each.hpp>
#include <tally/seq/requirements.hpp>

#include <tally/int_types.hpp>
#include <tally/utility.hpp>

#include <type_traits>

namespace tally {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// perfectly_balanced(predicate)
//
// True iff the sequence has an even number of items and exactly half of them pass `predicate`.  Always
// consumes the entire sequence.
//
template <typename Predicate>
struct PerfectlyBalancedBinder {
    Predicate predicate;
};

template <typename Predicate>
inline PerfectlyBalancedBinder<std::decay_t<Predicate>> perfectly_balanced(Predicate&& predicate)
{
    return {TALLY_FORWARD(predicate)};
}

template <typename Seq, typename Predicate, typename = EnableIfSeq<Seq>>
[[nodiscard]] bool operator|(Seq&& seq, PerfectlyBalancedBinder<Predicate>&& binder)
{
    static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                  "(seq::perfectly_balanced) Sequences may not be captured implicitly by reference.");

    usize total = 0;
    usize matched = 0;

    TALLY_FORWARD(seq) | for_each([&](auto&& item) {
        ++total;
        if (binder.predicate(item)) {
            ++matched;
        }
    });

    return total % 2 == 0 && total / 2 == matched;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_PERFECTLY_BALANCED_HPP
