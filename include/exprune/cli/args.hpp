#pragma once

/** \file args.hpp
 *  \brief Command-line surface of the exprune tool.
 *
 * Accepted forms: "--flag value", "--flag=value", "-f value", and clustered
 * boolean shorts such as "-fr". "--print_only" is accepted as an alias of
 * "--print-only".
 */

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "exprune/core/console.hpp"
#include "exprune/error.hpp"
#include "exprune/retention/pruner.hpp"

namespace exprune::cli {

inline constexpr std::string_view kVersion = "0.1.1";

enum class Action { run, help, version };

struct CliRequest {
  Action action{Action::run};
  retention::PruneOptions options;
  std::vector<std::string> warnings;  /**< non-fatal issues, e.g. an unknown --sort value */
};

[[nodiscard]] auto parse_args(const std::vector<std::string>& args)
    -> std::expected<CliRequest, core::error>;

[[nodiscard]] auto usage() -> std::string;

/** 2 for usage/configuration errors, 1 for everything else. */
[[nodiscard]] auto exit_code_for(const core::error& err) noexcept -> int;

/**
 * Environment knobs:
 * - EXPRUNE_NOW: reference time in seconds since the epoch (ignored with a warning if unparsable)
 */
void apply_env_overrides(retention::PruneOptions& opts, core::Console& console);

/** Full CLI run; returns the process exit code. */
[[nodiscard]] auto run_cli(const std::vector<std::string>& args, core::Console& console) -> int;

} // namespace exprune::cli
