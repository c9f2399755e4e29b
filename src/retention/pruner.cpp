#include "exprune/retention/pruner.hpp"
#include "exprune/retention/grouper.hpp"

#include <chrono>
#include <string>

namespace exprune::retention {

using core::error; using core::error_code;

auto validate_flags(const PruneOptions& opts) -> std::expected<void, error> {
  if (opts.quiet && opts.print_only) {
    return std::unexpected(error{error_code::config_invalid,
        "--quiet and --print-only cannot be used together.", "retention.pruner"});
  }
  if (opts.print_only && opts.force) {
    return std::unexpected(error{error_code::config_invalid,
        "--print-only and --force cannot be used together.", "retention.pruner"});
  }
  return {};
}

auto validate_options(const PruneOptions& opts) -> std::expected<void, error> {
  if (auto fx = validate_flags(opts); !fx) return fx;
  return check_directory(opts.path);
}

auto plan_prune(const PruneOptions& opts, core::Console& console)
    -> std::expected<std::vector<DirectorySelection>, error> {
  const auto now = opts.now.value_or(std::chrono::system_clock::now());
  std::vector<DirectorySelection> selections;

  if (opts.recursive) {
    auto tree = group_tree(opts.path, opts.sort, now, console);
    if (!tree) return std::unexpected(tree.error());
    for (const auto& [dir, groups] : *tree) {
      selections.push_back(select_buckets(dir, groups, opts.keep));
    }
  } else {
    auto groups = group_directory(opts.path, opts.sort, now, &console);
    if (!groups) return std::unexpected(groups.error());
    selections.push_back(select_buckets(opts.path, *groups, opts.keep));
  }

  for (const auto& sel : selections) {
    render_selection(console.report(), sel, opts.sort, opts.keep);
  }
  return selections;
}

auto run_prune(const PruneOptions& opts, core::Console& console) -> std::expected<PruneOutcome, error> {
  if (auto vx = validate_options(opts); !vx) return std::unexpected(vx.error());

  auto planned = plan_prune(opts, console);
  if (!planned) return std::unexpected(planned.error());

  PruneOutcome outcome;
  outcome.selections = std::move(*planned);
  outcome.summary = summarize(outcome.selections);
  const auto& to_delete = outcome.summary.to_delete;
  console.debug("plan", std::to_string(outcome.summary.to_keep.size()) + " keep, " +
                std::to_string(to_delete.size()) + " delete");

  if (opts.print_only) {
    console.report() << "\nPrint-only enabled, no files were deleted." << '\n';
    outcome.status = PruneStatus::dry_run;
    return outcome;
  }

  if (to_delete.empty()) {
    console.report() << "No files to delete." << '\n';
    outcome.status = PruneStatus::nothing_to_delete;
    return outcome;
  }

  if (!opts.force) {
    if (outcome.summary.to_keep.empty()) {
      console.error() << "WARNING! No files will be kept, you want ALL files to be deleted." << '\n';
    }
    if (!console.confirm("\nDo you want to proceed with deletion? There is no undo. (yes/no)")) {
      console.report() << "Operation cancelled." << '\n';
      outcome.status = PruneStatus::cancelled;
      return outcome;
    }
  }

  outcome.deletion = delete_files(to_delete, console);
  outcome.status = PruneStatus::deleted;
  return outcome;
}

} // namespace exprune::retention
