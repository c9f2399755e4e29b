#pragma once

/** \file deleter.hpp
 *  \brief Batch file removal that survives per-file failures.
 */

#include <filesystem>
#include <vector>

#include "exprune/core/console.hpp"
#include "exprune/error.hpp"

namespace exprune::retention {

struct DeletionFailure {
  std::filesystem::path path;
  core::error error;
};

struct DeletionReport {
  std::vector<std::filesystem::path> deleted;
  std::vector<DeletionFailure> failures;

  [[nodiscard]] bool all_succeeded() const noexcept { return failures.empty(); }
};

/**
 * Remove every file in order. Successes go to console.report(), failures to
 * console.error(); a failure never stops the batch. Callers that need
 * "everything was removed" check DeletionReport::all_succeeded().
 */
auto delete_files(const std::vector<std::filesystem::path>& files, core::Console& console)
    -> DeletionReport;

} // namespace exprune::retention
