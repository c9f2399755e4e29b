#include "exprune/core/console.hpp"
#include "exprune/core/platform_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <istream>

namespace exprune::core {

Console::Console(bool quiet)
    : Console(std::cout, std::cerr, std::cin, quiet) {}

Console::Console(std::ostream& out, std::ostream& err, std::istream& in, bool quiet)
    : out_(&out), err_(&err), in_(&in), quiet_(quiet),
      debug_(env_flag_enabled("EXPRUNE_DEBUG")) {}

std::ostream& Console::report() {
  return quiet_ ? null_ : *out_;
}

std::ostream& Console::error() {
  return *err_;
}

void Console::debug(std::string_view phase, std::string_view message) {
  if (!debug_) return;
  *err_ << "[exprune][" << phase << "] " << message << std::endl;
}

bool Console::confirm(std::string_view question) {
  *out_ << question << std::endl;
  auto line = read_line();
  if (!line) {
    debug("confirm", "end of input while waiting for an answer");
    return false;
  }
  return normalize_answer(*line) == "yes";
}

std::optional<std::string> Console::read_line() {
  std::string line;
  if (!std::getline(*in_, line)) return std::nullopt;
  return line;
}

std::string normalize_answer(std::string_view answer) {
  auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
  auto first = std::find_if_not(answer.begin(), answer.end(), is_space);
  auto last = std::find_if_not(answer.rbegin(), answer.rend(), is_space).base();
  std::string out;
  if (first < last) out.assign(first, last);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace exprune::core
