//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//

// Pull-based sequences and the predicate-counting combinators over them.
//
#pragma once
#ifndef TALLY_SEQ_HPP
#define TALLY_SEQ_HPP

#include <tally/config.hpp>
//
#include <tally/int_types.hpp>
#include <tally/optional.hpp>
#include <tally/seq/all_or_none.hpp>
#include <tally/seq/alternate.hpp>
#include <tally/seq/at_least.hpp>
#include <tally/seq/at_most.hpp>
#include <tally/seq/collect_vec.hpp>
#include <tally/seq/count_matches.hpp>
#include <tally/seq/exactly_m_n.hpp>
#include <tally/seq/exactly_n.hpp>
#include <tally/seq/for_each.hpp>
#include <tally/seq/perfectly_balanced.hpp>
#include <tally/seq/requirements.hpp>

#include <boost/range/begin.hpp>
#include <boost/range/end.hpp>

#include <iterator>
#include <utility>
#include <vector>

namespace tally {

/// Yields `*it` for each `it` in `[first, last)`.  Items are whatever the iterator's dereference returns,
/// so iterators into a container yield borrowed references.
///
template <typename Iter>
class IterSeq
{
   public:
    using Item = typename std::iterator_traits<Iter>::reference;

    explicit IterSeq(Iter first, Iter last) noexcept : first_{std::move(first)}, last_{std::move(last)}
    {
    }

    Optional<Item> peek()
    {
        if (this->first_ == this->last_) {
            return None;
        }
        return {*this->first_};
    }

    Optional<Item> next()
    {
        if (this->first_ == this->last_) {
            return None;
        }
        Optional<Item> item{*this->first_};
        ++this->first_;
        return item;
    }

   private:
    Iter first_;
    Iter last_;
};

template <typename Iter>
auto as_seq(Iter first, Iter last)
{
    return IterSeq<Iter>{std::move(first), std::move(last)};
}

// Borrows the elements of any Boost.Range-compatible range (standard containers, arrays, `boost::irange`,
// ...).  A container must outlive the sequence; a range whose iterators produce their own values (like
// `boost::irange`) may be a temporary.
//
template <typename Range, typename = decltype(boost::begin(std::declval<Range&>()))>
auto as_seq(Range&& range)
{
    return as_seq(boost::begin(range), boost::end(range));
}

/// A sequence that owns its items and yields them by const reference.  Copies are independent: each
/// has its own items and position.
///
template <typename T>
class VecSeq
{
   public:
    using Item = const T&;

    explicit VecSeq(std::vector<T>&& items) noexcept : items_(std::move(items))
    {
    }

    Optional<Item> peek()
    {
        if (this->pos_ == this->items_.size()) {
            return None;
        }
        return {this->items_[this->pos_]};
    }

    Optional<Item> next()
    {
        Optional<Item> item = this->peek();
        if (item) {
            ++this->pos_;
        }
        return item;
    }

   private:
    std::vector<T> items_;
    usize pos_ = 0;
};

template <typename T>
auto into_seq(std::vector<T>&& items)
{
    return VecSeq<T>{std::move(items)};
}

}  // namespace tally

#endif  // TALLY_SEQ_HPP
