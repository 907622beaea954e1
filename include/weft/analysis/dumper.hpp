#pragma once

#include <ostream>
#include <span>
#include <string>

#include "weft/analysis/functions.hpp"
#include "weft/analysis/parameter_set.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

// Deterministic text form of analyzed functions, for debugging and for
// golden tests.
class Dumper {
 public:
  Dumper(const Env* env, std::ostream* out);

  void Dump(std::span<const FunctionInfo> functions);
  void Dump(const FunctionInfo& function);
  void Dump(const ParameterSet& set);
  void Dump(const Transformation& step);

 private:
  void PrintIndent();
  void Indent();
  void Dedent();

  [[nodiscard]] auto TypeString(library::TypeId id) const -> std::string;

  const Env* env_;
  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace weft::analysis
