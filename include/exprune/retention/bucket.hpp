#pragma once

/** \file bucket.hpp
 *  \brief Exponential age buckets.
 *
 * A file aged d whole days lands in bucket b, the smallest power of two with
 * b >= d; age 0 lands in bucket 1. Boundaries are therefore 1, 2, 4, 8, 16, ...
 * days and the number of buckets grows with log2 of the oldest age.
 */

#include <bit>
#include <cstdint>
#include <optional>

#include "exprune/retention/types.hpp"

namespace exprune::retention {

inline constexpr std::uint64_t kSecondsPerDay = 86400;

/** Whole days between timestamp and now; nullopt when timestamp lies in the future. */
[[nodiscard]] auto age_in_days(time_point now, time_point timestamp) noexcept
    -> std::optional<std::uint64_t>;

[[nodiscard]] constexpr auto bucket_for_age(std::uint64_t days) noexcept -> std::uint64_t {
  return days == 0 ? 1 : std::bit_ceil(days);
}

} // namespace exprune::retention
