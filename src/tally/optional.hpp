//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_OPTIONAL_HPP
#define TALLY_OPTIONAL_HPP

#include <tally/config.hpp>
//

#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>

#include <utility>

namespace tally {

// Every sequence stage reports its next item (or exhaustion) as an Optional.  `Optional<T&>` is
// supported, which lets sequences over a container hand out borrowed items.
//
template <typename T>
using Optional = boost::optional<T>;

namespace {
decltype(auto) None = boost::none;
}  // namespace

template <typename... Args>
auto make_optional(Args&&... args)
{
    return boost::make_optional(std::forward<Args>(args)...);
}

}  // namespace tally

#endif  // TALLY_OPTIONAL_HPP
