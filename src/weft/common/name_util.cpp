#include "weft/common/name_util.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace weft::common {

namespace {

// Sorted for binary search.
constexpr std::array<std::string_view, 56> kKeywords = {
    "Self",    "abstract", "alignof", "as",       "async",  "await",
    "become",  "box",      "break",   "const",    "continue", "crate",
    "do",      "dyn",      "else",    "enum",     "extern", "false",
    "final",   "fn",       "for",     "if",       "impl",   "in",
    "let",     "loop",     "macro",   "match",    "mod",    "move",
    "mut",     "offsetof", "override", "priv",    "proc",   "pub",
    "pure",    "ref",      "return",  "self",     "sizeof", "static",
    "struct",  "super",    "trait",   "true",     "try",    "type",
    "typeof",  "unsafe",   "unsized", "use",      "virtual", "where",
    "while",   "yield",
};

}  // namespace

auto IsKeyword(std::string_view name) -> bool {
  return std::ranges::binary_search(kKeywords, name);
}

auto MangleKeywords(std::string_view name) -> std::string {
  if (IsKeyword(name)) {
    return std::string(name) + "_";
  }
  return std::string(name);
}

auto ShortName(std::string_view full_name) -> std::string_view {
  auto dot = full_name.rfind('.');
  if (dot == std::string_view::npos) {
    return full_name;
  }
  return full_name.substr(dot + 1);
}

}  // namespace weft::common
