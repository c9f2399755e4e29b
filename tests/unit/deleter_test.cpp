#include <catch2/catch_test_macros.hpp>
#include <exprune/retention/deleter.hpp>

#include <filesystem>
#include <sstream>

#include <unistd.h>

#include "tests/support/fs_test_helpers.hpp"

using namespace exprune;
using namespace fs_test_helpers;
namespace fs = std::filesystem;

TEST_CASE("delete_files removes every listed file", "[retention][deleter]") {
  ScratchDir dir("deleter_basic");
  write_file(dir / "file1.txt");
  write_file(dir / "file2.txt");
  std::ostringstream out, err; std::istringstream in;
  core::Console console(out, err, in);

  auto report = retention::delete_files({dir / "file1.txt", dir / "file2.txt"}, console);
  REQUIRE(report.all_succeeded());
  REQUIRE(report.deleted.size() == 2);
  REQUIRE_FALSE(fs::exists(dir / "file1.txt"));
  REQUIRE_FALSE(fs::exists(dir / "file2.txt"));
  REQUIRE(out.str().find("Deleting files...") != std::string::npos);
  REQUIRE(out.str().find("File deleted: " + (dir / "file1.txt").string()) != std::string::npos);
  REQUIRE(err.str().empty());
}

TEST_CASE("delete_files continues past a vanished file", "[retention][deleter][errors]") {
  ScratchDir dir("deleter_vanished");
  write_file(dir / "keep_going.txt");
  std::ostringstream out, err; std::istringstream in;
  core::Console console(out, err, in);

  auto report = retention::delete_files({dir / "gone.txt", dir / "keep_going.txt"}, console);
  REQUIRE_FALSE(report.all_succeeded());
  REQUIRE(report.failures.size() == 1);
  REQUIRE(report.failures.front().path == dir / "gone.txt");
  REQUIRE(report.failures.front().error.code == core::error_code::not_found);
  REQUIRE(report.deleted.size() == 1);
  REQUIRE_FALSE(fs::exists(dir / "keep_going.txt"));
  REQUIRE(err.str().find("Error during deletion " + (dir / "gone.txt").string()) != std::string::npos);
}

TEST_CASE("delete_files reports io errors and keeps going", "[retention][deleter][errors]") {
  ScratchDir dir("deleter_io");
  fs::create_directory(dir / "subdir");
  write_file(dir / "next.txt");
  std::ostringstream out, err; std::istringstream in;
  core::Console console(out, err, in);

  // unlink refuses directories regardless of privileges
  auto report = retention::delete_files({dir / "subdir", dir / "next.txt"}, console);
  REQUIRE(report.failures.size() == 1);
  REQUIRE(report.failures.front().path == dir / "subdir");
  REQUIRE(report.failures.front().error.code == core::error_code::io_failed);
  REQUIRE(err.str().find("Error during deletion " + (dir / "subdir").string() + ": ") != std::string::npos);
  REQUIRE(fs::is_directory(dir / "subdir"));
  REQUIRE(report.deleted.size() == 1);
  REQUIRE_FALSE(fs::exists(dir / "next.txt"));
}

TEST_CASE("delete_files reports permission errors without aborting", "[retention][deleter][errors]") {
  if (::geteuid() == 0) {
    WARN("running as root: directory permissions are not enforced, skipping");
    return;
  }
  ScratchDir dir("deleter_perm");
  fs::create_directory(dir / "locked");
  write_file(dir / "locked" / "file1.txt");
  fs::permissions(dir / "locked", fs::perms::owner_read | fs::perms::owner_exec);
  std::ostringstream out, err; std::istringstream in;
  core::Console console(out, err, in);

  auto report = retention::delete_files({dir / "locked" / "file1.txt"}, console);
  fs::permissions(dir / "locked", fs::perms::owner_all);

  REQUIRE(report.failures.size() == 1);
  REQUIRE(report.failures.front().error.code == core::error_code::io_failed);
  REQUIRE(fs::exists(dir / "locked" / "file1.txt"));
}

TEST_CASE("quiet console suppresses deletion progress but not errors", "[retention][deleter][quiet]") {
  ScratchDir dir("deleter_quiet");
  write_file(dir / "file1.txt");
  std::ostringstream out, err; std::istringstream in;
  core::Console console(out, err, in, /*quiet=*/true);

  auto report = retention::delete_files({dir / "file1.txt", dir / "missing.txt"}, console);
  REQUIRE(report.deleted.size() == 1);
  REQUIRE(out.str().empty());
  REQUIRE_FALSE(err.str().empty());
}
