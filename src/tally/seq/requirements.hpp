//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_SEQ_REQUIREMENTS_HPP
#define TALLY_SEQ_REQUIREMENTS_HPP

#include <tally/optional.hpp>

#include <type_traits>
#include <utility>

namespace tally {

// A Seq is any type `T` with:
//
//  - a nested type `T::Item`, which is never an rvalue reference; borrowing sequences use `U&`
//  - `Optional<Item> next()`: consume and return the next item, or None once exhausted
//  - `Optional<Item> peek()`: return what `next()` would, without consuming it
//
// Sequences are single-pass.  Once `next()` has returned None, it keeps returning None.
//
template <typename T>
using SeqItem = typename std::decay_t<T>::Item;

template <typename T, typename = void>
struct HasSeqRequirements : std::false_type {
};

template <typename T>
struct HasSeqRequirements<
    T, std::void_t<SeqItem<T>, decltype(std::declval<T&>().next()), decltype(std::declval<T&>().peek())>>
    : std::bool_constant<!std::is_rvalue_reference_v<SeqItem<T>> &&
                         std::is_convertible_v<decltype(std::declval<T&>().next()), Optional<SeqItem<T>>> &&
                         std::is_convertible_v<decltype(std::declval<T&>().peek()), Optional<SeqItem<T>>>> {
};

template <typename T>
inline constexpr bool is_seq_v = HasSeqRequirements<std::decay_t<T>>::value;

template <typename T>
using EnableIfSeq = std::enable_if_t<is_seq_v<T>>;

}  // namespace tally

#endif  // TALLY_SEQ_REQUIREMENTS_HPP
