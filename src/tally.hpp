//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//

// Convenience header to include all of the Tally library.
//
#pragma once

#include "tally/assert.hpp"
#include "tally/config.hpp"
#include "tally/int_types.hpp"
#include "tally/logging.hpp"
#include "tally/optional.hpp"
#include "tally/seq.hpp"
#include "tally/type_traits.hpp"
#include "tally/utility.hpp"
