#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "weft/analysis/ref_mode.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

// A parameter of the generated binding's callable signature.
struct SurfaceParameter {
  uint32_t native_index;  // Index into ParameterSet::native
  std::string name;
  library::TypeId typ;
  bool allow_none = false;
};

// A parameter exactly as the foreign call needs it. Transfer,
// caller-allocates, nullability and ref mode are resolved values, not the
// declared ones.
struct NativeParameter {
  std::string name;
  library::TypeId typ;
  std::string c_type;
  bool instance_parameter = false;
  library::ParameterDirection direction = library::ParameterDirection::kIn;
  bool nullable = false;
  library::Transfer transfer = library::Transfer::kNone;
  bool caller_allocates = false;
  bool is_error = false;
  library::ParameterScope scope = library::ParameterScope::kCall;
  std::optional<uint32_t> user_data_index;
  std::optional<uint32_t> destroy_index;
  RefMode ref_mode = RefMode::kNone;
};

// Conversion steps. Everything except LengthLink turns a surface value into
// its native counterpart.
struct ToNativeDirect {
  std::string name;
};

struct ToNativeScalar {
  std::string name;
  bool nullable = false;
};

struct ToNativePointer {
  std::string name;
  bool instance_parameter = false;
  library::Transfer transfer = library::Transfer::kNone;
  RefMode ref_mode = RefMode::kNone;
  // Suffix applied to the surface value before converting, e.g. ".as_ref()"
  std::string to_native_extra;
  // Filled by emission
  std::string explicit_target_type;
  std::string pointer_cast;
  bool in_trait = false;
  bool nullable = false;
};

struct ToNativeBorrow {};

struct ToNativeUnknown {
  std::string name;
};

// Native slot carries the element count of `array_name`. An empty array
// name refers to the function's return value.
struct LengthLink {
  std::string array_name;
  std::string length_name;
  std::string length_type;
};

// The slot is always filled, so the value is just wrapped as present.
struct ToSome {
  std::string name;
};

// The slot receives a raw pointer that takes ownership of the value.
struct IntoRaw {
  std::string name;
};

using TransformationKind = std::variant<
    ToNativeDirect, ToNativeScalar, ToNativePointer, ToNativeBorrow,
    ToNativeUnknown, LengthLink, ToSome, IntoRaw>;

// Suffix marking a nullable object converted through a shared reference.
inline constexpr const char* kAsRefExtra = ".as_ref()";

[[nodiscard]] auto IsToNative(const TransformationKind& kind) -> bool;

// Copy of `kind` with ToNativePointer::to_native_extra replaced. Other
// kinds are returned unchanged.
auto WithToNativeExtra(const TransformationKind& kind, std::string extra)
    -> TransformationKind;

auto KindName(const TransformationKind& kind) -> const char*;

struct Transformation {
  uint32_t native_index;                // Index into ParameterSet::native
  std::optional<uint32_t> surface_index;  // Index into ParameterSet::surface
  TransformationKind kind;
};

// Lowered parameters of one function. Built once by LowerParameters; the
// only later change is AnalyzeReturn appending the return length link.
struct ParameterSet {
  std::vector<SurfaceParameter> surface;
  std::vector<NativeParameter> native;
  std::vector<Transformation> transformations;

  // If the return value declares an array length parameter that exists in
  // `native`, append a length link for it. Does nothing otherwise, or when
  // that parameter already carries a length link.
  void AnalyzeReturn(
      const Env& env, const std::optional<library::Parameter>& ret);

  // Transformation steps applied to one native slot, in order.
  [[nodiscard]] auto TransformationsFor(uint32_t native_index) const
      -> std::vector<const Transformation*>;
};

}  // namespace weft::analysis
