//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_EXACTLY_N_HPP
#define TALLY_SEQ_EXACTLY_N_HPP

#include <tally/config.hpp>
//
#include <tally/seq/for_each.hpp>
#include <tally/seq/requirements.hpp>

#include <tally/assert.hpp>
#include <tally/int_types.hpp>
#include <tally/logging.hpp>
#include <tally/utility.hpp>

#include <type_traits>

namespace tally {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// exactly_n(n, predicate)
//
// True iff exactly `n` items of the sequence satisfy `predicate`.  Fails as soon as the (n+1)-th match is
// seen, without pulling the rest of the sequence; otherwise the whole sequence is consumed.
//
template <typename Predicate>
struct ExactlyNBinder {
    usize n;
    Predicate predicate;
};

template <typename Predicate>
inline ExactlyNBinder<std::decay_t<Predicate>> exactly_n(usize n, Predicate&& predicate)
{
    return {n, TALLY_FORWARD(predicate)};
}

template <typename Seq, typename Predicate, typename = EnableIfSeq<Seq>>
[[nodiscard]] bool operator|(Seq&& seq, ExactlyNBinder<Predicate>&& binder)
{
    static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                  "(seq::exactly_n) Sequences may not be captured implicitly by reference.");

    usize i = 0;
    usize matched = 0;

    const LoopControl result = TALLY_FORWARD(seq) | for_each([&](auto&& item) {
                                   if (binder.predicate(item)) {
                                       ++matched;
                                       if (TALLY_HINT_FALSE(matched > binder.n)) {
                                           TALLY_DVLOG(1) << "(seq::exactly_n) too many matches at item " << i
                                                          << TALLY_INSPECT(binder.n);
                                           return kBreak;
                                       }
                                   }
                                   ++i;
                                   return kContinue;
                               });

    if (result == kBreak) {
        return false;
    }
    TALLY_ASSERT_LE(matched, binder.n);

    return matched == binder.n;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_EXACTLY_N_HPP
