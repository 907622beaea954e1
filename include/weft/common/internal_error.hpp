#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace weft::common {

// Exception type for internal weft errors (generator bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in weft. Please report it with the library "
                "manifest that triggered it.",
                context, detail)) {
  }
};

}  // namespace weft::common
