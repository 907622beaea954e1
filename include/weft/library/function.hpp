#pragma once

#include <optional>
#include <string>
#include <vector>

#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::library {

struct Function {
  std::string name;          // Binding-level name, e.g. "set_data"
  std::string c_identifier;  // Native symbol, e.g. "demo_widget_set_data"

  // Type the function is declared on; invalid for free functions.
  TypeId owner = TypeId::Invalid();

  std::vector<Parameter> parameters;

  // Absent for functions returning nothing.
  std::optional<Parameter> ret;

  bool throws = false;
  std::optional<std::string> finish_func;
};

}  // namespace weft::library
