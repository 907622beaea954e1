#include "weft/analysis/ref_mode.hpp"

#include <optional>
#include <string_view>

#include "weft/analysis/env.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

using library::Fundamental;
using library::ParameterDirection;
using library::TypeKind;

auto InOnly(ParameterDirection direction, RefMode mode) -> RefMode {
  return direction == ParameterDirection::kIn ? mode : RefMode::kNone;
}

}  // namespace

auto RefModeOf(
    const Env& env, library::TypeId type, ParameterDirection direction)
    -> RefMode {
  if (const auto* object = env.FindObjectConfig(type)) {
    if (object->ref_mode) {
      return InOnly(direction, *object->ref_mode);
    }
  }

  const library::Type& info = env.TypeOf(type);
  switch (info.Kind()) {
    case TypeKind::kFundamental:
      switch (info.AsFundamental()) {
        case Fundamental::kUtf8:
        case Fundamental::kFilename:
        case Fundamental::kOsString:
          return InOnly(direction, RefMode::kByRef);
        default:
          return RefMode::kNone;
      }

    case TypeKind::kClass:
    case TypeKind::kInterface:
    case TypeKind::kList:
    case TypeKind::kSList:
    case TypeKind::kPtrArray:
    case TypeKind::kCArray:
      return InOnly(direction, RefMode::kByRef);

    case TypeKind::kRecord:
      return InOnly(
          direction, info.AsRecord().refcounted ? RefMode::kByRef
                                                : RefMode::kByRefMut);

    case TypeKind::kUnion:
      return InOnly(direction, RefMode::kByRefMut);

    case TypeKind::kAlias:
      return RefModeOf(env, info.AsAlias().target, direction);

    default:
      return RefMode::kNone;
  }
}

auto RefModeWithoutUnneededMut(
    const Env& env, const library::Parameter& par, bool immutable,
    bool self_in_trait) -> RefMode {
  RefMode mode = RefModeOf(env, par.typ, par.direction);
  bool mut_ptr = IsMutPtr(par.c_type);
  switch (mode) {
    case RefMode::kByRefMut:
      if (!mut_ptr) {
        return RefMode::kByRef;
      }
      if (immutable) {
        return RefMode::kByRefImmut;
      }
      return mode;
    case RefMode::kByRef:
      if (self_in_trait) {
        return mut_ptr ? RefMode::kByRefFake : RefMode::kByRefConst;
      }
      return mode;
    default:
      return mode;
  }
}

auto IsMutPtr(std::string_view c_type) -> bool {
  if (c_type == "gpointer") {
    return true;
  }
  auto end = c_type.find_last_not_of(" \t");
  if (end == std::string_view::npos || c_type[end] != '*') {
    return false;
  }
  // Only the outermost pointee matters: "const char**" points at a mutable
  // `const char*`, "const char* const*" and "const GdkRGBA*" do not.
  std::string_view pointee = c_type.substr(0, end);
  auto inner_end = pointee.find_last_not_of(" \t");
  if (inner_end == std::string_view::npos) {
    return false;
  }
  pointee = pointee.substr(0, inner_end + 1);
  if (pointee.ends_with("const")) {
    return false;
  }
  if (pointee.find('*') == std::string_view::npos &&
      (pointee.starts_with("const ") || pointee.starts_with("gconst"))) {
    return false;
  }
  return true;
}

auto ToString(RefMode mode) -> const char* {
  switch (mode) {
    case RefMode::kNone:
      return "none";
    case RefMode::kByRef:
      return "ref";
    case RefMode::kByRefMut:
      return "ref_mut";
    case RefMode::kByRefImmut:
      return "ref_immut";
    case RefMode::kByRefConst:
      return "ref_const";
    case RefMode::kByRefFake:
      return "ref_fake";
  }
  return "none";
}

auto ParseRefMode(std::string_view text) -> std::optional<RefMode> {
  if (text == "none") return RefMode::kNone;
  if (text == "ref") return RefMode::kByRef;
  if (text == "ref_mut") return RefMode::kByRefMut;
  if (text == "ref_immut") return RefMode::kByRefImmut;
  if (text == "ref_const") return RefMode::kByRefConst;
  if (text == "ref_fake") return RefMode::kByRefFake;
  return std::nullopt;
}

}  // namespace weft::analysis
