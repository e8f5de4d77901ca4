//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_ALL_OR_NONE_HPP
#define TALLY_SEQ_ALL_OR_NONE_HPP

#include <tally/config.hpp>
//
#include <tally/seq/for_each.hpp>
#include <tally/seq/requirements.hpp>

#include <tally/logging.hpp>
#include <tally/utility.hpp>

#include <type_traits>

namespace tally {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// all_or_none(predicate)
//
// True iff every item passes `predicate` or no item does (so the empty sequence is true).  Returns false
// on the first item that disagrees with an earlier one.
//
template <typename Predicate>
struct AllOrNoneBinder {
    Predicate predicate;
};

template <typename Predicate>
inline AllOrNoneBinder<std::decay_t<Predicate>> all_or_none(Predicate&& predicate)
{
    return {TALLY_FORWARD(predicate)};
}

template <typename Seq, typename Predicate, typename = EnableIfSeq<Seq>>
[[nodiscard]] bool operator|(Seq&& seq, AllOrNoneBinder<Predicate>&& binder)
{
    static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                  "(seq::all_or_none) Sequences may not be captured implicitly by reference.");

    bool has_pass = false;
    bool has_fail = false;

    const LoopControl result = TALLY_FORWARD(seq) | for_each([&](auto&& item) {
                                   if (binder.predicate(item)) {
                                       has_pass = true;
                                   } else {
                                       has_fail = true;
                                   }
                                   if (has_pass && has_fail) {
                                       TALLY_DVLOG(1) << "(seq::all_or_none) mixed result";
                                       return kBreak;
                                   }
                                   return kContinue;
                               });

    return result == kContinue;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_ALL_OR_NONE_HPP
