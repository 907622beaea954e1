#include "weft/analysis/async_params.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "weft/analysis/parameter_set.hpp"
#include "weft/common/overloaded.hpp"

namespace weft::analysis {

namespace {

auto CallbackToSome(const std::string& name)
    -> std::optional<TransformationKind> {
  if (name != kCallbackParamName) {
    return std::nullopt;
  }
  spdlog::debug("async: '{}' passed as present value", name);
  return ToSome{.name = name};
}

}  // namespace

auto IsAsyncParamToRemove(std::string_view name) -> bool {
  return name == kUserDataParamName || name.ends_with("data");
}

auto RestructureAsyncTransformation(TransformationKind kind)
    -> TransformationKind {
  auto replacement = std::visit(
      Overloaded{
          [](const ToNativeDirect& step) { return CallbackToSome(step.name); },
          [](const ToNativeUnknown& step) { return CallbackToSome(step.name); },
          [](const ToNativePointer& step)
              -> std::optional<TransformationKind> {
            if (step.name != kUserDataParamName) {
              return std::nullopt;
            }
            spdlog::debug(
                "async: '{}' converted into raw owned pointer", step.name);
            return IntoRaw{.name = step.name};
          },
          [](const auto&) -> std::optional<TransformationKind> {
            return std::nullopt;
          },
      },
      kind);
  if (replacement) {
    return *std::move(replacement);
  }
  return kind;
}

}  // namespace weft::analysis
