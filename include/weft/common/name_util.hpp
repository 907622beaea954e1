#pragma once

#include <string>
#include <string_view>

namespace weft::common {

// Returns true if `name` is reserved in the target language.
auto IsKeyword(std::string_view name) -> bool;

// Reserved identifiers get a trailing underscore, everything else is
// returned unchanged.
auto MangleKeywords(std::string_view name) -> std::string;

// Last component of a dotted name: "Gio.AsyncReadyCallback" ->
// "AsyncReadyCallback".
auto ShortName(std::string_view full_name) -> std::string_view;

}  // namespace weft::common
