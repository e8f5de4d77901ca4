//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_EXACTLY_M_N_HPP
#define TALLY_SEQ_EXACTLY_M_N_HPP

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
// exactly_m_n(m, m_predicate, n, n_predicate)
//
// True iff exactly `m` items satisfy `m_predicate` and, simultaneously, exactly `n` items satisfy
// `n_predicate`.  Both predicates are invoked on every item pulled, `m_predicate` first, even after one
// of the two counts has reached its target.  Pulling stops as soon as either count goes over.
//
template <typename MPredicate, typename NPredicate>
struct ExactlyMNBinder {
    usize m;
    MPredicate m_predicate;
    usize n;
    NPredicate n_predicate;
};

template <typename MPredicate, typename NPredicate>
inline ExactlyMNBinder<std::decay_t<MPredicate>, std::decay_t<NPredicate>> exactly_m_n(
    usize m, MPredicate&& m_predicate, usize n, NPredicate&& n_predicate)
{
    return {m, TALLY_FORWARD(m_predicate), n, TALLY_FORWARD(n_predicate)};
}

template <typename Seq, typename MPredicate, typename NPredicate, typename = EnableIfSeq<Seq>>
[[nodiscard]] bool operator|(Seq&& seq, ExactlyMNBinder<MPredicate, NPredicate>&& binder)
{
    static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                  "(seq::exactly_m_n) Sequences may not be captured implicitly by reference.");

    usize i = 0;
    usize m_matched = 0;
    usize n_matched = 0;

    const LoopControl result = TALLY_FORWARD(seq) | for_each([&](auto&& item) {
                                   const bool m_match = bool(binder.m_predicate(item));
                                   const bool n_match = bool(binder.n_predicate(item));

                                   m_matched += m_match;
                                   n_matched += n_match;

                                   if (TALLY_HINT_FALSE(m_matched > binder.m || n_matched > binder.n)) {
                                       TALLY_DVLOG(1) << "(seq::exactly_m_n) too many matches at item " << i
                                                      << TALLY_INSPECT(m_matched) << TALLY_INSPECT(n_matched);
                                       return kBreak;
                                   }
                                   ++i;
                                   return kContinue;
                               });

    if (result == kBreak) {
        return false;
    }
    TALLY_ASSERT_LE(m_matched, binder.m);
    TALLY_ASSERT_LE(n_matched, binder.n);

    return m_matched == binder.m && n_matched == binder.n;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_EXACTLY_M_N_HPP
