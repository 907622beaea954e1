#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

// How a value crosses the binding boundary.
enum class ConversionType : uint8_t {
  kDirect,   // Same representation on both sides
  kScalar,   // Value type needing a cheap conversion (bool, enums, flags)
  kPointer,  // Pointer-backed value with ownership semantics
  kBorrow,   // Borrowed through a no-op conversion
  kUnknown,  // No known conversion; output needs manual review
};

// Classify a type. Total and pure: unsupported shapes degrade to kUnknown.
// A `conversion_type` configured on the type's object takes precedence.
auto ClassifyConversion(const Env& env, library::TypeId type) -> ConversionType;

// Value types carry no ownership across the boundary.
inline auto IsValueConversion(ConversionType conversion) -> bool {
  return conversion == ConversionType::kDirect ||
         conversion == ConversionType::kScalar;
}

auto ToString(ConversionType conversion) -> const char*;
auto ParseConversionType(std::string_view text) -> std::optional<ConversionType>;

}  // namespace weft::analysis
