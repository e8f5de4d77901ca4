//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_COLLECT_VEC_HPP
#define TALLY_SEQ_COLLECT_VEC_HPP

#include <tally/config.hpp>
//
#include <tally/seq/requirements.hpp>

#include <type_traits>
#include <utility>
#include <vector>

namespace tally {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// collect_vec()
//
struct CollectVecBinder {
};

inline CollectVecBinder collect_vec()
{
    return {};
}

/// Drains `seq` into a vector.  Owned items are moved in; borrowed items are copied.
///
template <typename Seq, typename = EnableIfSeq<Seq>>
[[nodiscard]] std::vector<std::decay_t<SeqItem<Seq>>> operator|(Seq&& seq, CollectVecBinder)
{
    static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                  "(seq::collect_vec) Sequences may not be captured implicitly by reference.");

    std::vector<std::decay_t<SeqItem<Seq>>> items;
    while (auto item = seq.next()) {
        items.emplace_back(std::forward<SeqItem<Seq>>(*item));
    }
    return items;
}

}  // namespace seq
}  // namespace tally

#endif  // TALLY_SEQ_COLLECT_VEC_HPP
