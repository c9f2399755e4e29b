#pragma once

/** \file time_selector.hpp
 *  \brief Which file timestamp drives aging and ordering.
 */

#include <optional>
#include <string_view>

#include "exprune/platform/file_stat.hpp"
#include "exprune/retention/types.hpp"

namespace exprune::retention {

enum class SortKey {
  modified,  /**< mtime */
  changed,   /**< ctime: inode status change, the closest POSIX has to creation time */
  accessed,  /**< atime */
};

/** Case-insensitive "mtime" | "ctime" | "atime"; anything else is nullopt. */
[[nodiscard]] auto parse_sort_key(std::string_view text) -> std::optional<SortKey>;

/** Display name used in reports: "MTime", "CTime" or "ATime". */
[[nodiscard]] auto to_string(SortKey key) noexcept -> std::string_view;

/**
 * Pick the requested timestamp from file metadata.
 * A timestamp the platform does not provide degrades to the epoch (time zero).
 */
[[nodiscard]] auto select_time(const platform::FileStat& st, SortKey key) noexcept -> time_point;

} // namespace exprune::retention
