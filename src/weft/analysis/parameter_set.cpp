#include "weft/analysis/parameter_set.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "weft/analysis/array_length.hpp"
#include "weft/common/overloaded.hpp"
#include "weft/library/parameter.hpp"

namespace weft::analysis {

auto IsToNative(const TransformationKind& kind) -> bool {
  return !std::holds_alternative<LengthLink>(kind);
}

auto WithToNativeExtra(const TransformationKind& kind, std::string extra)
    -> TransformationKind {
  if (const auto* pointer = std::get_if<ToNativePointer>(&kind)) {
    ToNativePointer rebuilt = *pointer;
    rebuilt.to_native_extra = std::move(extra);
    return rebuilt;
  }
  return kind;
}

auto KindName(const TransformationKind& kind) -> const char* {
  return std::visit(
      Overloaded{
          [](const ToNativeDirect&) { return "to_native_direct"; },
          [](const ToNativeScalar&) { return "to_native_scalar"; },
          [](const ToNativePointer&) { return "to_native_pointer"; },
          [](const ToNativeBorrow&) { return "to_native_borrow"; },
          [](const ToNativeUnknown&) { return "to_native_unknown"; },
          [](const LengthLink&) { return "length"; },
          [](const ToSome&) { return "to_some"; },
          [](const IntoRaw&) { return "into_raw"; },
      },
      kind);
}

void ParameterSet::AnalyzeReturn(
    const Env& env, const std::optional<library::Parameter>& ret) {
  if (!ret || !ret->array_length) {
    return;
  }
  uint32_t native_index = *ret->array_length;
  if (native_index >= native.size()) {
    return;
  }
  bool linked = std::ranges::any_of(
      transformations, [&](const Transformation& step) {
        return step.native_index == native_index &&
               std::holds_alternative<LengthLink>(step.kind);
      });
  if (linked) {
    spdlog::debug(
        "return length '{}' already linked, skipped",
        native[native_index].name);
    return;
  }

  const NativeParameter& par = native[native_index];
  transformations.push_back(
      Transformation{
          .native_index = native_index,
          .surface_index = std::nullopt,
          .kind = MakeLengthLink(env, "", par.name, par.typ),
      });
}

auto ParameterSet::TransformationsFor(uint32_t native_index) const
    -> std::vector<const Transformation*> {
  std::vector<const Transformation*> result;
  for (const Transformation& step : transformations) {
    if (step.native_index == native_index) {
      result.push_back(&step);
    }
  }
  return result;
}

}  // namespace weft::analysis
