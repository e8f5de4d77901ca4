//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_ASSERT_HPP
#define TALLY_ASSERT_HPP

#include <tally/config.hpp>
//
#include <tally/type_traits.hpp>
#include <tally/utility.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#ifdef TALLY_GLOG_AVAILABLE
#include <glog/logging.h>
#define TALLY_FAIL_CHECK_OUT LOG(ERROR)
#else
#define TALLY_FAIL_CHECK_OUT std::cerr
#endif

namespace tally {

// Values with an `operator<<` are printed as-is in a failed-check message.
//
template <typename T, typename = std::enable_if_t<IsPrintable<T>{}>>
decltype(auto) make_printable(T&& obj)
{
    return TALLY_FORWARD(obj);
}

// Anything else is shown as its type name and a hex dump of its object bytes, two digits per byte.
//
template <typename T, typename = std::enable_if_t<!IsPrintable<T>{}>, typename = void>
std::string make_printable(T&& obj)
{
    const auto* first = reinterpret_cast<const unsigned char*>(&obj);
    const auto* last = first + sizeof(obj);

    std::ostringstream oss;
    oss << "(" << name_of<std::decay_t<T>>() << ") " << std::hex << std::setfill('0');
    for (; first != last; ++first) {
        oss << std::setw(2) << static_cast<int>(*first);
    }
    return oss.str();
}

[[noreturn]] inline void fail_check_exit()
{
    TALLY_FAIL_CHECK_OUT << std::endl;
    std::abort();
}

// =============================================================================
// TALLY_CHECK*(...) is always evaluated; TALLY_ASSERT*(...) only when NDEBUG is not defined.  On failure
// both print the expression, both operand values, the enclosing function and any message streamed onto
// the macro, then abort.
//
#define TALLY_CHECK_RELATION(left, op, right)                                                                \
    for (; !TALLY_HINT_TRUE((left)op(right)); ::tally::fail_check_exit())                                    \
    TALLY_FAIL_CHECK_OUT << "FATAL: " << __FILE__ << ":" << __LINE__                                         \
                         << ": Assertion failed: " #left " " #op " " #right "\n (in `" << __PRETTY_FUNCTION__ \
                         << "`)\n\n  " #left " == " << ::tally::make_printable(left)                          \
                         << "\n  " #right " == " << ::tally::make_printable(right) << "\n\n"

#define TALLY_CHECK(x) TALLY_CHECK_RELATION(bool{x}, ==, true)
#define TALLY_CHECK_EQ(x, y) TALLY_CHECK_RELATION(x, ==, y)
#define TALLY_CHECK_LE(x, y) TALLY_CHECK_RELATION(x, <=, y)

#ifndef NDEBUG
#define TALLY_ASSERT_LE(x, y) TALLY_CHECK_LE(x, y)
#else
#define TALLY_ASSERT_LE(x, y)                                                                                \
    if (false && ((x) <= (y)))                                                                               \
    TALLY_FAIL_CHECK_OUT
#endif

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// TALLY_INSPECT(expr) : " expr == <value>", for appending to a check or log message.
//
#define TALLY_INSPECT(expr) " " << #expr << " == " << (expr)

}  // namespace tally

#endif  // TALLY_ASSERT_HPP
