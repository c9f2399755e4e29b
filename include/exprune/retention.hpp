#pragma once

/** \file retention.hpp
 *  \brief Umbrella header for retention APIs.
 *
 *  This header includes the public exponential retention interfaces:
 *   - Timestamp selection (time_selector.hpp)
 *   - Age buckets (bucket.hpp)
 *   - Directory and tree grouping (grouper.hpp)
 *   - Keep/delete selection and report rendering (selector.hpp)
 *   - Batch deletion (deleter.hpp)
 *   - End-to-end run (pruner.hpp)
 *
 *  Doxygen groups:
 *   - \defgroup retention_api Retention API
 *   - \brief Exponential age-bucket retention for plain directories
 *   - \{
 */

#include "exprune/retention/time_selector.hpp"
#include "exprune/retention/bucket.hpp"
#include "exprune/retention/grouper.hpp"
#include "exprune/retention/selector.hpp"
#include "exprune/retention/deleter.hpp"
#include "exprune/retention/pruner.hpp"

/** \} */
