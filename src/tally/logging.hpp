//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef TALLY_LOGGING_HPP
#define TALLY_LOGGING_HPP

#include <tally/config.hpp>

// TALLY_LOG(severity), TALLY_VLOG(level), TALLY_DVLOG(level): stream-style log statements.
//
#ifdef TALLY_GLOG_AVAILABLE

#include <glog/logging.h>

#define TALLY_LOG(severity) LOG(severity)
#define TALLY_VLOG(level) VLOG(level)
#define TALLY_DVLOG(level) DVLOG(level)

#else  // ==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

#include <iostream>

// The streamed operands still have to compile, but are never evaluated.
//
#define TALLY_LOG_DISABLED                                                                                   \
    if (false)                                                                                               \
    std::cerr

#define TALLY_LOG(severity) TALLY_LOG_DISABLED
#define TALLY_VLOG(level) TALLY_LOG_DISABLED
#define TALLY_DVLOG(level) TALLY_LOG_DISABLED

#endif  // TALLY_GLOG_AVAILABLE

#endif  // TALLY_LOGGING_HPP
