//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_UTILITY_HPP
#define TALLY_UTILITY_HPP

#include <tally/config.hpp>
//

#include <utility>

namespace tally {

/// Perfectly forward `x` without repeating its type.
///
#define TALLY_FORWARD(x) std::forward<decltype(x)>(x)

/// Return a copy of `value`.  Every combinator consumes its sequence, so a caller that wants to run a
/// second query over the same items has to say so at the call site:
///
/// ```
/// auto nums = tally::as_seq(v);
///
/// bool a = tally::make_copy(nums) | tally::seq::at_least(2, is_odd);  // `nums` still usable
/// bool b = std::move(nums) | tally::seq::all_or_none(is_odd);         // `nums` consumed
/// ```
///
template <typename T>
T make_copy(const T& value)
{
    return value;
}

}  // namespace tally

#endif  // TALLY_UTILITY_HPP
