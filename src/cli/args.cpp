#include "exprune/cli/args.hpp"
#include "exprune/core/platform_utils.hpp"

#include <charconv>
#include <system_error>
#include <chrono>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

namespace exprune::cli {

namespace {

using core::error; using core::error_code;

auto usage_error(std::string message) -> error {
  return error{error_code::config_invalid, std::move(message), "cli.args"};
}

// "--key=value" -> value; nullopt when arg is not that key.
std::optional<std::string> eat(std::string_view a, std::string_view key) {
  if (a.size() > key.size() && a.rfind(key, 0) == 0 && a[key.size()] == '=') {
    return std::string(a.substr(key.size() + 1));
  }
  return std::nullopt;
}

bool set_bool_short(char c, retention::PruneOptions& o) {
  switch (c) {
    case 'f': o.force = true; return true;
    case 'o': o.print_only = true; return true;
    case 'r': o.recursive = true; return true;
    case 'q': o.quiet = true; return true;
    default: return false;
  }
}

auto parse_keep(std::string_view v) -> std::expected<std::size_t, error> {
  std::uint32_t n = 0;
  const auto* first = v.data();
  const auto* last = v.data() + v.size();
  auto [ptr, ec] = std::from_chars(first, last, n);
  if (v.empty() || ec != std::errc{} || ptr != last) {
    return std::unexpected(usage_error("invalid value '" + std::string(v) +
                                       "' for '--keep <KEEP>': expected a non-negative integer"));
  }
  return static_cast<std::size_t>(n);
}

} // namespace

auto parse_args(const std::vector<std::string>& args) -> std::expected<CliRequest, error> {
  CliRequest req;
  auto& o = req.options;
  std::optional<std::string> path, sort, keep;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    auto next_value = [&](std::string_view flag) -> std::expected<std::string, error> {
      if (i + 1 >= args.size()) {
        return std::unexpected(usage_error("a value is required for '" + std::string(flag) + "' but none was supplied"));
      }
      return args[++i];
    };

    if (a == "--help" || a == "-h") { req.action = Action::help; return req; }
    if (a == "--version" || a == "-V") { req.action = Action::version; return req; }

    if (auto v = eat(a, "--path")) { path = *v; continue; }
    if (auto v = eat(a, "--sort")) { sort = *v; continue; }
    if (auto v = eat(a, "--keep")) { keep = *v; continue; }

    if (a == "--path" || a == "-p") {
      auto v = next_value("--path <PATH>"); if (!v) return std::unexpected(v.error());
      path = *v;
    } else if (a == "--sort" || a == "-s") {
      auto v = next_value("--sort <SORT>"); if (!v) return std::unexpected(v.error());
      sort = *v;
    } else if (a == "--keep" || a == "-k") {
      auto v = next_value("--keep <KEEP>"); if (!v) return std::unexpected(v.error());
      keep = *v;
    } else if (a == "--force") {
      o.force = true;
    } else if (a == "--print-only" || a == "--print_only") {
      o.print_only = true;
    } else if (a == "--recursive") {
      o.recursive = true;
    } else if (a == "--quiet") {
      o.quiet = true;
    } else if (a.size() >= 2 && a[0] == '-' && a[1] != '-') {
      for (std::size_t c = 1; c < a.size(); ++c) {
        if (!set_bool_short(a[c], o)) return std::unexpected(usage_error("unexpected argument '" + a + "' found"));
      }
    } else {
      return std::unexpected(usage_error("unexpected argument '" + a + "' found"));
    }
  }

  std::string missing;
  if (!path) missing += " --path <PATH>";
  if (!keep) missing += " --keep <KEEP>";
  if (!missing.empty()) {
    return std::unexpected(usage_error("the following required arguments were not provided:" + missing));
  }

  o.path = *path;
  auto k = parse_keep(*keep);
  if (!k) return std::unexpected(k.error());
  o.keep = *k;

  o.sort = retention::SortKey::changed;
  if (sort) {
    if (auto key = retention::parse_sort_key(*sort)) o.sort = *key;
    else req.warnings.emplace_back("Invalid sort type. Defaulting to ctime.");
  }
  return req;
}

auto usage() -> std::string {
  std::ostringstream os;
  os << "Simple tool for deleting files exponentially based on their times in a specified path\n\n"
     << "Usage: exprune --path <PATH> --keep <KEEP> [OPTIONS]\n\n"
     << "Options:\n"
     << "  -p, --path <PATH>   Path to the directory\n"
     << "  -s, --sort <SORT>   Sort by: mtime (modification time), ctime (status change time),\n"
     << "                      atime (access time) [default: ctime]\n"
     << "  -k, --keep <KEEP>   Number of files to keep per time segment\n"
     << "  -f, --force         FOR EXPERTS ONLY! Delete without prompting. Cannot be used with --print-only\n"
     << "  -o, --print-only    Dry run, no files are deleted. Cannot be used with --force or --quiet\n"
     << "  -r, --recursive     Also process subdirectories, each one grouped on its own\n"
     << "  -q, --quiet         No output except errors. Cannot be used with --print-only\n"
     << "  -h, --help          Print help\n"
     << "  -V, --version       Print version\n\n"
     << "Environment:\n"
     << "  EXPRUNE_DEBUG=1     Trace grouping and deletion on stderr\n"
     << "  EXPRUNE_NOW=<secs>  Reference time (seconds since epoch) used to age files\n";
  return os.str();
}

auto exit_code_for(const error& err) noexcept -> int {
  return err.code == error_code::config_invalid ? 2 : 1;
}

void apply_env_overrides(retention::PruneOptions& opts, core::Console& console) {
  if (!core::safe_getenv("EXPRUNE_NOW")) return;
  if (auto secs = core::env_int("EXPRUNE_NOW")) {
    opts.now = retention::time_point{std::chrono::seconds{*secs}};
    console.debug("config", "reference time from EXPRUNE_NOW=" + std::to_string(*secs));
  } else {
    console.error() << "Ignoring invalid EXPRUNE_NOW value." << '\n';
  }
}

auto run_cli(const std::vector<std::string>& args, core::Console& console) -> int {
  auto req = parse_args(args);
  if (!req) {
    console.error() << "Error: " << req.error().message << "\n\nFor more information, try '--help'." << '\n';
    return exit_code_for(req.error());
  }
  if (req->action == Action::help) { console.report() << usage(); return 0; }
  if (req->action == Action::version) { console.report() << "exprune " << kVersion << '\n'; return 0; }

  auto& opts = req->options;
  if (auto vx = retention::validate_options(opts); !vx) {
    console.error() << "Error: " << vx.error().message << '\n';
    return exit_code_for(vx.error());
  }
  for (const auto& w : req->warnings) console.error() << w << '\n';
  apply_env_overrides(opts, console);
  console.set_quiet(opts.quiet);

  auto rx = retention::run_prune(opts, console);
  if (!rx) {
    console.error() << "Error: " << rx.error().message << '\n';
    return exit_code_for(rx.error());
  }
  return 0;
}

} // namespace exprune::cli
