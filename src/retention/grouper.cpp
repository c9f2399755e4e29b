#include "exprune/retention/grouper.hpp"
#include "exprune/platform/file_stat.hpp"
#include "exprune/retention/bucket.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace exprune::retention {

namespace {

namespace fs = std::filesystem;
using core::error; using core::error_code;

auto scan_failed(const fs::path& dir, const std::error_code& ec) -> error {
  const auto code = (ec == std::errc::no_such_file_or_directory) ? error_code::not_found : error_code::io_failed;
  return error{code, "cannot read directory " + dir.string() + ": " + ec.message(), "retention.grouper"};
}

} // namespace

auto check_directory(const fs::path& dir) -> std::expected<void, error> {
  constexpr const char* component = "retention.grouper";
  std::error_code ec;
  const auto st = fs::status(dir, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return std::unexpected(error{error_code::io_failed, "cannot access " + dir.string() + ": " + ec.message(), component});
  }
  if (!fs::exists(st)) {
    return std::unexpected(error{error_code::not_found, "The provided path does not exist.", component});
  }
  if (!fs::is_directory(st)) {
    return std::unexpected(error{error_code::not_a_directory, "The provided path is a file, not a directory.", component});
  }
  return {};
}

auto group_directory(const fs::path& dir, SortKey key, time_point now, core::Console* console)
    -> std::expected<BucketMap, error> {
  if (auto ok = check_directory(dir); !ok) return std::unexpected(ok.error());

  BucketMap groups;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return std::unexpected(scan_failed(dir, ec));
  for (; it != fs::directory_iterator{}; it.increment(ec)) {
    const auto& path = it->path();
    auto st = platform::stat_no_follow(path);
    if (!st) {
      if (st.error().code != error_code::not_found) return std::unexpected(st.error());
      if (console) console->debug("group", "vanished during scan: " + path.string());
      continue;
    }
    if (!st->is_regular()) continue;

    const auto ts = select_time(*st, key);
    const auto days = age_in_days(now, ts);
    if (!days) {
      if (console) console->debug("group", "skipping future timestamp: " + path.string());
      continue;
    }
    groups[bucket_for_age(*days)].push_back(FileRecord{path, ts});
  }
  if (ec) return std::unexpected(scan_failed(dir, ec));

  if (groups.empty()) {
    return std::unexpected(error{error_code::empty_result,
        "No files found in the directory. Remember that the program only works with files, not directories.",
        "retention.grouper"});
  }
  if (console) {
    console->debug("group", dir.string() + ": " + std::to_string(groups.size()) + " bucket(s)");
  }
  return groups;
}

auto group_tree(const fs::path& root, SortKey key, time_point now, core::Console& console)
    -> std::expected<TreeBuckets, error> {
  if (auto ok = check_directory(root); !ok) return std::unexpected(ok.error());

  std::vector<fs::path> dirs{root};
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
  if (ec) return std::unexpected(scan_failed(root, ec));
  for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
    const auto st = it->symlink_status(ec);
    if (ec) return std::unexpected(scan_failed(it->path(), ec));
    if (fs::is_directory(st)) dirs.push_back(it->path());
  }
  if (ec) return std::unexpected(scan_failed(root, ec));
  console.debug("walk", std::to_string(dirs.size()) + " director" + (dirs.size() == 1 ? "y" : "ies") + " under " + root.string());

  TreeBuckets all_groups;
  for (const auto& dir : dirs) {
    auto groups = group_directory(dir, key, now, &console);
    if (!groups) {
      if (groups.error().code != error_code::empty_result) return std::unexpected(groups.error());
      console.report() << "Directory " << dir.string() << " is empty. Skipping." << '\n';
      continue;
    }
    all_groups.emplace(dir, std::move(*groups));
  }

  if (all_groups.empty()) {
    return std::unexpected(error{error_code::empty_result,
        "No files found in the directory or its subdirectories. Remember that the program only works with files, not directories.",
        "retention.grouper"});
  }
  return all_groups;
}

} // namespace exprune::retention
