#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

// How the generated binding accesses a native parameter.
enum class RefMode : uint8_t {
  kNone,        // By value or ownership
  kByRef,       // Shared reference
  kByRefMut,    // Exclusive reference
  kByRefImmut,  // Exclusive in native terms, exposed as shared
  kByRefConst,  // Trait receiver behind a const native pointer
  kByRefFake,   // Trait receiver needing only a shared reference
};

// Base mode derived from the type and direction. A `ref_mode` configured on
// the type's object replaces the derived mode for In parameters.
auto RefModeOf(
    const Env& env, library::TypeId type, library::ParameterDirection direction)
    -> RefMode;

// Base mode refined by the native spelling: exclusive access is only kept
// where the native pointer is mutable and the parameter is not configured
// immutable; trait receivers get a mode that avoids exclusive access.
auto RefModeWithoutUnneededMut(
    const Env& env, const library::Parameter& par, bool immutable,
    bool self_in_trait) -> RefMode;

// True for a native spelling such as "GtkWidget*" and false for
// "const GtkWidget*", "gconstpointer" or a non-pointer.
auto IsMutPtr(std::string_view c_type) -> bool;

[[nodiscard]] inline auto IsRef(RefMode mode) -> bool {
  return mode != RefMode::kNone;
}

auto ToString(RefMode mode) -> const char*;
auto ParseRefMode(std::string_view text) -> std::optional<RefMode>;

}  // namespace weft::analysis
