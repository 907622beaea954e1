#include "weft/analysis/verify.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "weft/analysis/parameter_set.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"

namespace weft::analysis {

namespace {

struct SlotUse {
  uint32_t primary = 0;
  uint32_t length = 0;
  bool folded = false;
  bool surfaced = false;
};

auto Violation(std::string_view label, std::string detail)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::Error(ElementPath{.path = std::string(label)}, std::move(detail)));
}

}  // namespace

auto VerifyParameterSet(
    const ParameterSet& set, size_t descriptor_count, std::string_view label)
    -> Result<void> {
  if (set.native.size() != descriptor_count) {
    return Violation(
        label, fmt::format(
                   "native.size() ({}) != descriptor count ({})",
                   set.native.size(), descriptor_count));
  }

  std::vector<SlotUse> slots(set.native.size());

  for (size_t i = 0; i < set.surface.size(); ++i) {
    uint32_t native_index = set.surface[i].native_index;
    if (native_index >= set.native.size()) {
      return Violation(
          label, fmt::format(
                     "surface[{}].native_index = {} is out of range "
                     "(native.size() = {})",
                     i, native_index, set.native.size()));
    }
    slots[native_index].surfaced = true;
  }

  for (size_t i = 0; i < set.transformations.size(); ++i) {
    const Transformation& step = set.transformations[i];
    if (step.native_index >= set.native.size()) {
      return Violation(
          label, fmt::format(
                     "step {} ({}): native_index = {} is out of range "
                     "(native.size() = {})",
                     i, KindName(step.kind), step.native_index,
                     set.native.size()));
    }
    if (step.surface_index) {
      if (*step.surface_index >= set.surface.size()) {
        return Violation(
            label, fmt::format(
                       "step {} ({}): surface_index = {} is out of range "
                       "(surface.size() = {})",
                       i, KindName(step.kind), *step.surface_index,
                       set.surface.size()));
      }
      if (set.surface[*step.surface_index].native_index != step.native_index) {
        return Violation(
            label, fmt::format(
                       "step {} ({}): surface {} belongs to native {}, not {}",
                       i, KindName(step.kind), *step.surface_index,
                       set.surface[*step.surface_index].native_index,
                       step.native_index));
      }
    }

    SlotUse& slot = slots[step.native_index];
    if (IsToNative(step.kind)) {
      ++slot.primary;
      continue;
    }
    ++slot.length;
    // Return links carry no array name and may share a surfaced slot.
    if (!std::get<LengthLink>(step.kind).array_name.empty()) {
      slot.folded = true;
    }
  }

  for (size_t i = 0; i < slots.size(); ++i) {
    const SlotUse& slot = slots[i];
    if (slot.primary > 1) {
      return Violation(
          label,
          fmt::format("native {} has {} primary steps", i, slot.primary));
    }
    if (slot.length > 1) {
      return Violation(
          label,
          fmt::format("native {} has {} length links", i, slot.length));
    }
    if (slot.folded && (slot.primary != 0 || slot.surfaced)) {
      return Violation(
          label, fmt::format(
                     "native {} '{}' is folded as a length but still has a "
                     "surface entry or primary step",
                     i, set.native[i].name));
    }
  }
  return {};
}

}  // namespace weft::analysis
