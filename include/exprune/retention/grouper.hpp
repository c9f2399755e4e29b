#pragma once

/** \file grouper.hpp
 *  \brief Scan directories and partition their regular files into age buckets.
 *
 * Notes
 * - Entries are inspected without following symlinks; only regular files count.
 * - Files whose selected timestamp lies in the future are skipped silently.
 * - A scan error aborts the whole grouping; no partial BucketMap is returned.
 */

#include <expected>
#include <filesystem>

#include "exprune/core/console.hpp"
#include "exprune/error.hpp"
#include "exprune/retention/time_selector.hpp"
#include "exprune/retention/types.hpp"

namespace exprune::retention {

/** Path must exist (not_found) and be a directory (not_a_directory); io_failed if status fails. */
[[nodiscard]] auto check_directory(const std::filesystem::path& dir) -> std::expected<void, core::error>;

/**
 * Group the direct regular-file children of dir.
 *
 * Errors: not_found (dir missing, or an entry vanished mid-scan),
 * not_a_directory, empty_result (no eligible file), io_failed.
 * console (optional) receives debug trace lines.
 */
[[nodiscard]] auto group_directory(const std::filesystem::path& dir, SortKey key, time_point now,
                                   core::Console* console = nullptr)
    -> std::expected<BucketMap, core::error>;

/**
 * Walk the tree under root (root included, symlinked directories not followed)
 * and group every directory independently over its direct children.
 *
 * Directories without eligible files are reported on console.report() and
 * skipped; empty_result only when the whole tree has none.
 */
[[nodiscard]] auto group_tree(const std::filesystem::path& root, SortKey key, time_point now,
                              core::Console& console)
    -> std::expected<TreeBuckets, core::error>;

} // namespace exprune::retention
