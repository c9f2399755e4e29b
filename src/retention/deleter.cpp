#include "exprune/retention/deleter.hpp"
#include "exprune/platform/file_stat.hpp"

#include <string>

namespace exprune::retention {

auto delete_files(const std::vector<std::filesystem::path>& files, core::Console& console)
    -> DeletionReport {
  DeletionReport report;
  console.report() << "\nDeleting files..." << '\n';
  for (const auto& file : files) {
    auto rx = platform::remove_file(file);
    if (rx) {
      console.report() << "File deleted: " << file.string() << '\n';
      report.deleted.push_back(file);
    } else {
      console.error() << "Error during deletion " << file.string() << ": " << rx.error().message << '\n';
      report.failures.push_back(DeletionFailure{file, rx.error()});
    }
  }
  console.debug("delete", std::to_string(report.deleted.size()) + " deleted, " +
                std::to_string(report.failures.size()) + " failed");
  return report;
}

} // namespace exprune::retention
