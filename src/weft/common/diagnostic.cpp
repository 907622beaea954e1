#include "weft/common/diagnostic/diagnostic.hpp"

#include <string>
#include <variant>

#include <fmt/core.h>

#include "weft/common/overloaded.hpp"

namespace weft {

auto FormatDiagSpan(const DiagSpan& span) -> std::string {
  return std::visit(
      Overloaded{
          [](const FileLocation& loc) -> std::string {
            if (loc.line == 0) {
              return loc.file;
            }
            return fmt::format("{}:{}", loc.file, loc.line);
          },
          [](const ElementPath& element) -> std::string {
            return element.path;
          },
          [](UnknownSpan) -> std::string { return {}; },
      },
      span);
}

}  // namespace weft
