#pragma once

/** \file types.hpp
 *  \brief Value types shared by the grouping and selection stages.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <vector>

namespace exprune::retention {

using time_point = std::chrono::system_clock::time_point;

/** One scanned file and the timestamp selected for it. */
struct FileRecord {
  std::filesystem::path path;
  time_point timestamp{};
};

/** Bucket id (day threshold) -> files in that bucket; ascending by id. */
using BucketMap = std::map<std::uint64_t, std::vector<FileRecord>>;

/** Directory -> its own BucketMap; ascending by path. Produced by recursive grouping. */
using TreeBuckets = std::map<std::filesystem::path, BucketMap>;

} // namespace exprune::retention
