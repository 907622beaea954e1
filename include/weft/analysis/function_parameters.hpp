#pragma once

#include <span>

#include "weft/analysis/parameter_set.hpp"
#include "weft/config/config.hpp"
#include "weft/library/parameter.hpp"

namespace weft::analysis {

struct Env;

struct LowerOptions {
  bool disable_length_detect = false;
  bool is_async = false;
  // Function is generated inside a shared trait; affects the receiver's
  // reference mode.
  bool in_trait = false;
};

// Lower one function's native parameter list into its surface list, native
// list and transformation program. Never fails: missing arrays, unmatched
// configuration and unknown conversions degrade to a conservative model.
//
// Postconditions:
// - native.size() == parameters.size(), in the same order
// - every step's native_index < native.size() and, when set,
//   surface_index < surface.size()
// - a parameter folded as a length has exactly one step, a LengthLink
//
// The return value's length link is added separately by
// ParameterSet::AnalyzeReturn.
auto LowerParameters(
    const Env& env, std::span<const library::Parameter> parameters,
    std::span<const config::FunctionConfig* const> configured_functions,
    const LowerOptions& options) -> ParameterSet;

}  // namespace weft::analysis
