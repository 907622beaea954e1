#include "weft/analysis/ownership.hpp"

#include <algorithm>
#include <span>

#include "weft/analysis/conversion_type.hpp"
#include "weft/analysis/env.hpp"
#include "weft/analysis/ref_mode.hpp"
#include "weft/config/config.hpp"
#include "weft/library/parameter.hpp"

namespace weft::analysis {

auto ResolveOwnership(
    const Env& env, const library::Parameter& par, library::TypeId type,
    std::span<const config::ParameterConfig* const> configured_parameters,
    bool in_trait) -> ResolvedOwnership {
  ResolvedOwnership result{
      .conversion = ClassifyConversion(env, type),
      .transfer = par.transfer,
      .caller_allocates = par.caller_allocates,
      .nullable = par.nullable,
      .ref_mode = RefMode::kNone,
  };

  if (IsValueConversion(result.conversion)) {
    result.caller_allocates = false;
    result.transfer = library::Transfer::kNone;
  }

  bool immutable = std::ranges::any_of(
      configured_parameters,
      [](const config::ParameterConfig* p) { return p->constant; });
  result.ref_mode = RefModeWithoutUnneededMut(
      env, par, immutable, in_trait && par.instance_parameter);

  for (const config::ParameterConfig* configured : configured_parameters) {
    if (configured->nullable) {
      result.nullable = *configured->nullable;
      break;
    }
  }
  return result;
}

}  // namespace weft::analysis
