#pragma once

#include <span>

#include "weft/analysis/conversion_type.hpp"
#include "weft/analysis/ref_mode.hpp"
#include "weft/config/config.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

struct ResolvedOwnership {
  ConversionType conversion;
  library::Transfer transfer;
  bool caller_allocates;
  bool nullable;
  RefMode ref_mode;
};

// Resolve ownership and access flags of one native parameter. `type` is the
// working type after string overrides; the reference mode is derived from
// the declared type. Value conversions (direct, scalar) drop transfer and
// caller-allocates; a configured `nullable` replaces the declared one; a
// configured `const` marks the parameter immutable.
auto ResolveOwnership(
    const Env& env, const library::Parameter& par, library::TypeId type,
    std::span<const config::ParameterConfig* const> configured_parameters,
    bool in_trait) -> ResolvedOwnership;

}  // namespace weft::analysis
