#pragma once

#include <span>

#include "weft/config/config.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

// Apply the first configured `string` override to a parameter type.
// String fundamentals are replaced directly; a C array of strings is
// replaced by the C array of the configured string type when the library
// already has one. Any other type is returned unchanged.
auto OverrideStringTypeParameter(
    const Env& env, library::TypeId type,
    std::span<const config::ParameterConfig* const> configured_parameters)
    -> library::TypeId;

}  // namespace weft::analysis
