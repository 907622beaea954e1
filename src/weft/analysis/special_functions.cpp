#include "weft/analysis/special_functions.hpp"

#include <optional>
#include <string>

#include "weft/analysis/env.hpp"
#include "weft/library/function.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

using library::Fundamental;
using library::TypeKind;

auto IsStringifyName(const std::string& name) -> bool {
  return name == "to_string" || name == "get_name";
}

auto IsStaticStringify(const Env& env, const library::Function& function)
    -> bool {
  if (!function.owner.IsValid() || !IsStringifyName(function.name)) {
    return false;
  }
  TypeKind owner_kind = env.TypeOf(function.owner).Kind();
  if (owner_kind != TypeKind::kEnumeration &&
      owner_kind != TypeKind::kBitfield) {
    return false;
  }

  if (function.parameters.size() != 1) {
    return false;
  }
  const library::Parameter& par = function.parameters.front();
  if (par.direction != library::ParameterDirection::kIn ||
      par.typ != function.owner) {
    return false;
  }

  if (!function.ret || function.ret->nullable) {
    return false;
  }
  library::TypeId ret_type = env.library->ResolveAlias(function.ret->typ);
  return env.TypeOf(ret_type).IsFundamental(Fundamental::kUtf8);
}

}  // namespace

auto DetectSpecialFunction(const Env& env, const library::Function& function)
    -> std::optional<FunctionType> {
  if (IsStaticStringify(env, function)) {
    return FunctionType::kStaticStringify;
  }
  return std::nullopt;
}

auto ToString(FunctionType type) -> const char* {
  switch (type) {
    case FunctionType::kStaticStringify:
      return "static_stringify";
  }
  return "static_stringify";
}

}  // namespace weft::analysis
