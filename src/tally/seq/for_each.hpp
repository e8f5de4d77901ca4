//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_FOR_EACH_HPP
#define TALLY_SEQ_FOR_EACH_HPP

#include <tally/config.hpp>
//
#include <tally/seq/requirements.hpp>
#include <tally/utility.hpp>

#include <type_traits>

namespace tally {
namespace seq {

// Returned by a loop body to stop (`kBreak`) or keep (`kContinue`) pulling.  Bodies that return nothing
// always continue.
//
enum LoopControl {
    kContinue = 0,
    kBreak = 1,
};

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// for_each(fn)
//
template <typename Fn>
struct ForEachBinder {
    Fn fn;
};

template <typename Fn>
ForEachBinder<Fn> for_each(Fn&& fn)
{
    return {TALLY_FORWARD(fn)};
}

/// Pulls items from `seq` one at a time, passing each to the loop body as an lvalue, until the sequence
/// is exhausted or the body returns `kBreak`.  No item past the breaking one is pulled.
///
template <typename Seq, typename Fn, typename = EnableIfSeq<Seq>>
LoopControl operator|(Seq&& seq, ForEachBinder<Fn>&& binder)
{
    while (auto item = seq.next()) {
        if constexpr (std::is_convertible_v<decltype(binder.fn(*item)), LoopControl>) {
            if (TALLY_HINT_FALSE(binder.fn(*item) == kBreak)) {
                return kBreak;
            }
        } else {
            binder.fn(*item);
        }
    }
    return kContinue;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_FOR_EACH_HPP
