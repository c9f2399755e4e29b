#include "tests/support/fs_test_helpers.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs_test_helpers {

namespace fs = std::filesystem;

ScratchDir::ScratchDir(const std::string& name)
    : path_(fs::temp_directory_path() / ("exprune_" + name + "_" + std::to_string(::getpid()))) {
  std::error_code ec;
  make_writable(path_);
  fs::remove_all(path_, ec);
  fs::create_directories(path_, ec);
  if (ec) throw std::runtime_error("cannot create scratch dir " + path_.string() + ": " + ec.message());
}

ScratchDir::~ScratchDir() {
  std::error_code ec;
  make_writable(path_);
  fs::remove_all(path_, ec);
}

void write_file(const fs::path& p, const std::string& content) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  if (!ofs) throw std::runtime_error("cannot create " + p.string());
  ofs << content;
  if (!ofs) throw std::runtime_error("cannot write " + p.string());
}

static struct timespec to_timespec(time_point tp) {
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
  ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
  if (ts.tv_nsec < 0) { ts.tv_nsec += 1000000000L; ts.tv_sec -= 1; }
  return ts;
}

void set_times(const fs::path& p, time_point atime, time_point mtime) {
  struct timespec times[2] = {to_timespec(atime), to_timespec(mtime)};
  if (::utimensat(AT_FDCWD, p.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
    throw std::runtime_error("utimensat " + p.string() + ": " + std::strerror(errno));
  }
}

void set_times_epoch(const fs::path& p, long long seconds) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(seconds);
  ts.tv_nsec = 0;
  struct timespec times[2] = {ts, ts};
  if (::utimensat(AT_FDCWD, p.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
    throw std::runtime_error("utimensat " + p.string() + ": " + std::strerror(errno));
  }
}

time_point truncated_now() {
  return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

time_point days_ago(time_point now, long long days) {
  return now - std::chrono::seconds{days * 86400LL};
}

void make_writable(const fs::path& root) {
  std::error_code ec;
  if (!fs::is_directory(fs::symlink_status(root, ec))) return;
  fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_directory(ec) && !it->is_symlink(ec)) {
      fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
    }
  }
}

std::vector<std::string> filenames(const std::vector<fs::path>& paths) {
  std::vector<std::string> out;
  out.reserve(paths.size());
  for (const auto& p : paths) out.push_back(p.filename().string());
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace fs_test_helpers
