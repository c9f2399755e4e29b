#include "exprune/retention/selector.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace exprune::retention {

auto select_bucket(std::uint64_t bucket_id, std::vector<FileRecord> files, std::size_t keep)
    -> BucketSelection {
  std::stable_sort(files.begin(), files.end(), [](const FileRecord& a, const FileRecord& b){
    return a.timestamp < b.timestamp;
  });
  const auto split = static_cast<std::ptrdiff_t>(std::min(keep, files.size()));

  BucketSelection out;
  out.bucket_id = bucket_id;
  out.keep.assign(std::make_move_iterator(files.begin()), std::make_move_iterator(files.begin() + split));
  out.to_delete.assign(std::make_move_iterator(files.begin() + split), std::make_move_iterator(files.end()));
  return out;
}

auto select_buckets(const std::filesystem::path& dir, const BucketMap& groups, std::size_t keep)
    -> DirectorySelection {
  DirectorySelection out;
  out.dir = dir;
  out.buckets.reserve(groups.size());
  for (const auto& [bucket_id, files] : groups) {
    out.buckets.push_back(select_bucket(bucket_id, files, keep));
  }
  return out;
}

auto summarize(const std::vector<DirectorySelection>& selections) -> SelectionSummary {
  SelectionSummary out;
  for (const auto& sel : selections) {
    for (const auto& b : sel.buckets) {
      for (const auto& f : b.keep) out.to_keep.push_back(f.path);
      for (const auto& f : b.to_delete) out.to_delete.push_back(f.path);
    }
  }
  return out;
}

auto format_timestamp(time_point tp) -> std::string {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &t);
#else
  localtime_r(&t, &local);
#endif
  std::ostringstream os;
  os << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return os.str();
}

void render_selection(std::ostream& out, const DirectorySelection& selection, SortKey key,
                      std::size_t keep) {
  out << "\nOpening " << selection.dir.string() << ", sorting by " << to_string(key)
      << " and keeping " << keep << " files\n";
  for (const auto& b : selection.buckets) {
    out << "\nYounger than " << b.bucket_id << " days but older than " << b.bucket_id / 2 << " days:\n";
    if (b.to_delete.empty()) out << "No files to delete in this group.\n";
    for (const auto& f : b.keep) {
      out << f.path.string() << " | " << format_timestamp(f.timestamp) << '\n';
    }
    for (const auto& f : b.to_delete) {
      out << f.path.string() << " | " << format_timestamp(f.timestamp) << " <-- to be deleted\n";
    }
  }
}

} // namespace exprune::retention
