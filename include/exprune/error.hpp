#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (exit-code mapping, tests).
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>

namespace exprune::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  not_found = 6001,
  not_a_directory = 6002,
  empty_result = 6003,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "retention.grouper" */
};

/** \brief True for the "nothing there" family: a missing path or a scope without eligible files. */
constexpr bool is_not_found_kind(error_code ec) noexcept {
  return ec == error_code::not_found || ec == error_code::empty_result;
}

} // namespace exprune::core
