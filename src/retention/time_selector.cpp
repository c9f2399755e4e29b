#include "exprune/retention/time_selector.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace exprune::retention {

auto parse_sort_key(std::string_view text) -> std::optional<SortKey> {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (lower == "mtime") return SortKey::modified;
  if (lower == "ctime") return SortKey::changed;
  if (lower == "atime") return SortKey::accessed;
  return std::nullopt;
}

auto to_string(SortKey key) noexcept -> std::string_view {
  switch (key) {
    case SortKey::modified: return "MTime";
    case SortKey::changed: return "CTime";
    case SortKey::accessed: return "ATime";
  }
  return "CTime";
}

auto select_time(const platform::FileStat& st, SortKey key) noexcept -> time_point {
  const std::optional<time_point>* picked = &st.changed;
  switch (key) {
    case SortKey::modified: picked = &st.modified; break;
    case SortKey::accessed: picked = &st.accessed; break;
    case SortKey::changed: picked = &st.changed; break;
  }
  return picked->value_or(time_point{});
}

} // namespace exprune::retention
