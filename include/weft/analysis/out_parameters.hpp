#pragma once

#include "weft/library/parameter.hpp"

namespace weft::analysis {

struct Env;

// Whether an Out parameter can be surfaced as (part of) the function's
// return value instead of a caller-provided slot.
auto CanAsReturn(const Env& env, const library::Parameter& par) -> bool;

}  // namespace weft::analysis
