#pragma once

/** \file selector.hpp
 *  \brief Per-bucket keep/delete partition and its human-readable report.
 *
 * Ordering policy
 * - Files of a bucket are stable-sorted ascending by timestamp (oldest first).
 * - The first min(K, size) entries of that order are kept; the rest are deleted.
 *   Each bucket therefore retains its oldest K files, which keeps a file's
 *   survival stable while it ages through a bucket.
 * - Equal timestamps keep their scan order (stable sort); no secondary key.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "exprune/retention/time_selector.hpp"
#include "exprune/retention/types.hpp"

namespace exprune::retention {

struct BucketSelection {
  std::uint64_t bucket_id{};
  std::vector<FileRecord> keep;       /**< ascending by timestamp */
  std::vector<FileRecord> to_delete;  /**< ascending by timestamp */
};

struct DirectorySelection {
  std::filesystem::path dir;
  std::vector<BucketSelection> buckets;  /**< ascending by bucket_id */
};

/** Keep/delete paths aggregated over one or more directories. */
struct SelectionSummary {
  std::vector<std::filesystem::path> to_keep;
  std::vector<std::filesystem::path> to_delete;
};

[[nodiscard]] auto select_bucket(std::uint64_t bucket_id, std::vector<FileRecord> files,
                                 std::size_t keep) -> BucketSelection;

[[nodiscard]] auto select_buckets(const std::filesystem::path& dir, const BucketMap& groups,
                                  std::size_t keep) -> DirectorySelection;

[[nodiscard]] auto summarize(const std::vector<DirectorySelection>& selections) -> SelectionSummary;

/** Local time as "YYYY-MM-DD HH:MM:SS". */
[[nodiscard]] auto format_timestamp(time_point tp) -> std::string;

/**
 * Write the grouped listing for one directory:
 *   Opening <dir>, sorting by <key> and keeping <K> files
 *   Younger than <b> days but older than <b/2> days:
 *   <path> | <timestamp>                  (keep)
 *   <path> | <timestamp> <-- to be deleted
 */
void render_selection(std::ostream& out, const DirectorySelection& selection, SortKey key,
                      std::size_t keep);

} // namespace exprune::retention
