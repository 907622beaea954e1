#pragma once

#include <cstddef>
#include <string_view>

#include "weft/analysis/parameter_set.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"

namespace weft::analysis {

// Verify ParameterSet invariants. Returns an error diagnostic naming the
// first violation.
// label: function path used in the message (e.g., "Demo.Widget.set_data").
//
// Invariants checked:
// - native.size() == descriptor_count
// - Each surface parameter's native_index < native.size()
// - Each step's native_index < native.size()
// - Each step's surface_index < surface.size() and refers back to the
//   step's native slot
// - At most one primary step and one LengthLink per native slot
// - A slot folded as the length of a parameter has no surface entry and no
//   primary step
auto VerifyParameterSet(
    const ParameterSet& set, size_t descriptor_count,
    std::string_view label = "function") -> Result<void>;

}  // namespace weft::analysis
