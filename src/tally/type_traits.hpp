//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_TYPE_TRAITS_HPP
#define TALLY_TYPE_TRAITS_HPP

#include <boost/core/demangle.hpp>

#include <ostream>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace tally {

// IsPrintable<T>: std::true_type iff `std::ostream& << T` is well-formed.
//
template <typename T, typename = void>
struct IsPrintable : std::false_type {
};

template <typename T>
struct IsPrintable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<T>())>>
    : std::true_type {
};

// The demangled name of `T`, for failed-check messages.
//
template <typename T>
inline std::string name_of()
{
    return boost::core::demangle(typeid(T).name());
}

}  // namespace tally

#endif  // TALLY_TYPE_TRAITS_HPP
