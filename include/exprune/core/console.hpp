#pragma once

/** \file console.hpp
 *  \brief Operator-facing streams: report output, error output, prompt input.
 *
 * Notes
 * - report() is the normal progress/report channel and is silenced in quiet mode.
 * - error() is never silenced; warnings and per-file errors go there.
 * - debug() lines are tagged "[exprune][phase]" and written to the error stream
 *   only when EXPRUNE_DEBUG is enabled (or set_debug(true) was called).
 * - Not thread-safe; one console per run.
 */

#include <iosfwd>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace exprune::core {

class Console {
public:
  /** Binds std::cout, std::cerr and std::cin. */
  explicit Console(bool quiet = false);
  Console(std::ostream& out, std::ostream& err, std::istream& in, bool quiet = false);

  Console(const Console&) = delete;
  Console& operator=(const Console&) = delete;

  [[nodiscard]] bool quiet() const noexcept { return quiet_; }
  [[nodiscard]] bool debug_enabled() const noexcept { return debug_; }
  void set_debug(bool enabled) noexcept { debug_ = enabled; }
  void set_quiet(bool quiet) noexcept { quiet_ = quiet; }

  /** Report stream; a discarding stream in quiet mode. */
  std::ostream& report();
  std::ostream& error();

  void debug(std::string_view phase, std::string_view message);

  /**
   * Ask a yes/no question and block until a line is read.
   * Returns true only for "yes" (trimmed, case-insensitive). End of input is "no".
   * The question is shown even in quiet mode since the operator has to answer it.
   */
  bool confirm(std::string_view question);

  /** Read one line without the trailing newline; nullopt at end of input. */
  std::optional<std::string> read_line();

private:
  std::ostream* out_;
  std::ostream* err_;
  std::istream* in_;
  std::ostream null_{nullptr};
  bool quiet_{false};
  bool debug_{false};
};

/** Trim ASCII whitespace on both ends and lowercase; used for prompt answers. */
std::string normalize_answer(std::string_view answer);

} // namespace exprune::core
