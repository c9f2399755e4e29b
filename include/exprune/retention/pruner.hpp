#pragma once

/** \file pruner.hpp
 *  \brief End-to-end retention run: validate, group, select, confirm, delete.
 *
 * States: Validate -> Group&Select -> ConfirmOrSkip -> Execute | DryRun -> Done.
 *
 * Mode matrix
 * - print_only: listing only, filesystem untouched; incompatible with force and quiet.
 * - force: no confirmation prompt.
 * - interactive (neither): prompt unless nothing is slated for deletion; an extra
 *   warning precedes the prompt when no file at all would be kept.
 * - quiet: silences report output only; errors and the prompt are still shown.
 *
 * Errors are returned, never turned into process exits here.
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <vector>

#include "exprune/core/console.hpp"
#include "exprune/error.hpp"
#include "exprune/retention/deleter.hpp"
#include "exprune/retention/selector.hpp"
#include "exprune/retention/time_selector.hpp"

namespace exprune::retention {

struct PruneOptions {
  std::filesystem::path path;             /**< directory to operate on */
  SortKey sort{SortKey::changed};         /**< timestamp used for aging and ordering */
  std::size_t keep{0};                    /**< files kept per bucket; 0 deletes everything */
  bool force{false};
  bool print_only{false};
  bool recursive{false};
  bool quiet{false};
  std::optional<time_point> now;          /**< reference time; wall clock when unset */
};

enum class PruneStatus { deleted, dry_run, cancelled, nothing_to_delete };

struct PruneOutcome {
  PruneStatus status{PruneStatus::nothing_to_delete};
  std::vector<DirectorySelection> selections;
  SelectionSummary summary;
  DeletionReport deletion;   /**< empty unless status == deleted */
};

/** Flag compatibility only; touches no filesystem state. */
[[nodiscard]] auto validate_flags(const PruneOptions& opts) -> std::expected<void, core::error>;

/** validate_flags, then the target must exist and be a directory. */
[[nodiscard]] auto validate_options(const PruneOptions& opts) -> std::expected<void, core::error>;

/** Group&Select without side effects besides the rendered listing. */
[[nodiscard]] auto plan_prune(const PruneOptions& opts, core::Console& console)
    -> std::expected<std::vector<DirectorySelection>, core::error>;

[[nodiscard]] auto run_prune(const PruneOptions& opts, core::Console& console)
    -> std::expected<PruneOutcome, core::error>;

} // namespace exprune::retention
