//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_INT_TYPES_HPP
#define TALLY_INT_TYPES_HPP

#include <cstddef>

namespace tally {

// Item counts and match thresholds.
//
using usize = std::size_t;

}  // namespace tally

#endif  // TALLY_INT_TYPES_HPP
