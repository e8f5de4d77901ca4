//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_CONFIG_HPP
#define TALLY_CONFIG_HPP

#if __cplusplus < 201703L
#error Tally requires C++17 or later!
#endif

// TALLY_GLOG_AVAILABLE: when defined, <tally/logging.hpp> and failed checks write through Google Log.
// The CMake build sets it on the `tally` target whenever a glog package is found.

// Branch prediction hints.
//
#define TALLY_HINT_TRUE(expr) __builtin_expect(static_cast<bool>(expr), 1)
#define TALLY_HINT_FALSE(expr) __builtin_expect(static_cast<bool>(expr), 0)

#endif  // TALLY_CONFIG_HPP
