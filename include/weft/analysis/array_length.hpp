#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "weft/analysis/parameter_set.hpp"
#include "weft/config/config.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

// Length parameter position -> name of the array declaring it through its
// `array_length` link.
using ArrayLengthIndex = absl::flat_hash_map<uint32_t, std::string>;

auto BuildArrayLengthIndex(std::span<const library::Parameter> parameters)
    -> ArrayLengthIndex;

// Naming heuristic: an In parameter whose name ends in "len" or contains
// "length". Known to misfire both ways; configuration corrects it.
auto IsLengthCandidate(const library::Parameter& par) -> bool;

// Whether values of the type carry an element count: strings, every array
// and list kind, hash tables, and aliases of those.
auto HasLength(const Env& env, library::TypeId type) -> bool;

// Heuristic detection: the parameter at `pos` is a length candidate and the
// parameter just before it has a length-bearing type. Returns that
// parameter's declared name.
auto DetectLength(
    const Env& env, size_t pos, std::span<const library::Parameter> parameters)
    -> std::optional<std::string>;

// Name of the array whose element count the parameter at `pos` carries,
// keyword-mangled. Sources in priority order: a configured `length_of`
// naming an existing parameter, a back link from `back_links`, then
// DetectLength unless `disable_length_detect`.
auto ResolveArrayName(
    const Env& env, size_t pos, std::span<const library::Parameter> parameters,
    const ArrayLengthIndex& back_links,
    std::span<const config::ParameterConfig* const> configured_parameters,
    bool disable_length_detect) -> std::optional<std::string>;

auto MakeLengthLink(
    const Env& env, std::string array_name, std::string length_name,
    library::TypeId length_type) -> LengthLink;

}  // namespace weft::analysis
