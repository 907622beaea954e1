#pragma once

#include "weft/config/config.hpp"
#include "weft/library/library.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

// Read-only environment threaded explicitly through every analysis.
// Neither pointee is mutated while analyses run, so one Env may be shared
// by concurrent lowerings.
struct Env {
  const library::Library* library;
  const config::Config* config;

  [[nodiscard]] auto TypeOf(library::TypeId id) const -> const library::Type& {
    return (*library)[id];
  }

  // Configuration of the named type, or nullptr.
  [[nodiscard]] auto FindObjectConfig(library::TypeId id) const
      -> const config::ObjectConfig*;

  // Final flag of the type, honoring a configured `final_type` override.
  [[nodiscard]] auto IsFinalType(library::TypeId id) const -> bool;
};

}  // namespace weft::analysis
