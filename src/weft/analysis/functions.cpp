#include "weft/analysis/functions.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "weft/analysis/env.hpp"
#include "weft/analysis/function_parameters.hpp"
#include "weft/analysis/parameter_set.hpp"
#include "weft/analysis/special_functions.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/common/diagnostic/diagnostic_sink.hpp"
#include "weft/common/name_util.hpp"
#include "weft/config/config.hpp"
#include "weft/library/function.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

using library::TypeKind;

auto ConfiguredFunctions(const Env& env, const library::Function& function)
    -> std::vector<const config::FunctionConfig*> {
  if (!function.owner.IsValid()) {
    return config::MatchedFunctions(env.config->functions, function.name);
  }
  const auto* object = env.FindObjectConfig(function.owner);
  if (object == nullptr) {
    return {};
  }
  return config::MatchedFunctions(object->functions, function.name);
}

void ReportUnknownConversions(
    const Env& env, const std::string& path, const ParameterSet& set,
    DiagnosticSink& sink) {
  for (const Transformation& step : set.transformations) {
    const auto* unknown = std::get_if<ToNativeUnknown>(&step.kind);
    if (unknown == nullptr) {
      continue;
    }
    const NativeParameter& native = set.native[step.native_index];
    sink.Warning(
        ElementPath{.path = path},
        fmt::format(
            "parameter '{}' of type '{}' has no known conversion",
            unknown->name, env.library->FullName(native.typ)));
  }
}

void ReportUnmatchedParameters(
    const library::Function& function, const std::string& path,
    std::span<const config::FunctionConfig* const> configured,
    DiagnosticSink& sink) {
  std::vector<std::string> names;
  names.reserve(function.parameters.size());
  for (const library::Parameter& par : function.parameters) {
    names.push_back(
        par.instance_parameter ? par.name : common::MangleKeywords(par.name));
  }

  for (const config::FunctionConfig* entry : configured) {
    for (const config::ParameterConfig& par : entry->parameters) {
      bool matched = std::ranges::any_of(
          names, [&](const std::string& name) {
            return par.ident.Matches(name);
          });
      if (!matched) {
        sink.Warning(
            ElementPath{.path = path},
            fmt::format(
                "configured parameter '{}' matches no parameter",
                par.ident.Text()));
      }
    }
  }
}

// Function entries of one configuration scope that select no function of
// the library.
void ReportUnmatchedFunctions(
    const Env& env, std::span<const config::FunctionConfig> entries,
    library::TypeId owner, const std::string& scope, DiagnosticSink& sink) {
  for (const config::FunctionConfig& entry : entries) {
    bool matched = std::ranges::any_of(
        env.library->Functions(), [&](const library::Function& function) {
          return function.owner == owner && entry.ident.Matches(function.name);
        });
    if (!matched) {
      sink.Warning(
          ElementPath{.path = scope},
          fmt::format(
              "configured function '{}' matches no function",
              entry.ident.Text()));
    }
  }
}

}  // namespace

auto FunctionPath(const Env& env, const library::Function& function)
    -> std::string {
  if (function.owner.IsValid()) {
    return fmt::format(
        "{}.{}", env.library->FullName(function.owner), function.name);
  }
  return fmt::format("{}.{}", env.library->Namespace(), function.name);
}

auto IsAsyncFunction(const Env& env, const library::Function& function)
    -> bool {
  if (function.name.ends_with("_finish")) {
    return false;
  }
  if (function.finish_func) {
    return true;
  }
  return std::ranges::any_of(
      function.parameters, [&](const library::Parameter& par) {
        const library::Type& type =
            env.TypeOf(env.library->ResolveAlias(par.typ));
        return type.Kind() == TypeKind::kCallback &&
               type.CType() == kAsyncReadyCallbackCType;
      });
}

auto IsInTrait(const Env& env, const library::Function& function) -> bool {
  if (!function.owner.IsValid()) {
    return false;
  }
  const library::Type& owner = env.TypeOf(function.owner);
  if (owner.IsInterface()) {
    return true;
  }
  if (!owner.IsClass() || env.IsFinalType(function.owner)) {
    return false;
  }
  const auto* object = env.FindObjectConfig(function.owner);
  return object == nullptr || object->generate_trait;
}

auto AnalyzeFunction(
    const Env& env, const library::Function& function, DiagnosticSink* sink)
    -> FunctionInfo {
  std::vector<const config::FunctionConfig*> configured =
      ConfiguredFunctions(env, function);

  FunctionInfo info{
      .name = function.name,
      .c_identifier = function.c_identifier,
      .owner = function.owner,
      .is_async = IsAsyncFunction(env, function),
      .throws = function.throws,
      .in_trait = IsInTrait(env, function),
      .disable_length_detect = std::ranges::any_of(
          configured,
          [](const config::FunctionConfig* entry) {
            return entry->disable_length_detect;
          }),
      .parameters = {},
      .special = DetectSpecialFunction(env, function),
      .finish_func = function.finish_func,
  };

  info.parameters = LowerParameters(
      env, function.parameters, configured,
      LowerOptions{
          .disable_length_detect = info.disable_length_detect,
          .is_async = info.is_async,
          .in_trait = info.in_trait,
      });
  info.parameters.AnalyzeReturn(env, function.ret);

  spdlog::debug(
      "analyzed {}: {} surface, {} native, {} steps", function.c_identifier,
      info.parameters.surface.size(), info.parameters.native.size(),
      info.parameters.transformations.size());

  if (sink != nullptr) {
    std::string path = FunctionPath(env, function);
    ReportUnknownConversions(env, path, info.parameters, *sink);
    ReportUnmatchedParameters(function, path, configured, *sink);
  }
  return info;
}

auto AnalyzeLibrary(const Env& env, DiagnosticSink* sink)
    -> std::vector<FunctionInfo> {
  std::vector<FunctionInfo> result;
  result.reserve(env.library->Functions().size());
  for (const library::Function& function : env.library->Functions()) {
    result.push_back(AnalyzeFunction(env, function, sink));
  }

  if (sink == nullptr) {
    return result;
  }

  // Object entries are visited by name so warnings come out in a stable
  // order.
  std::vector<const config::ObjectConfig*> objects;
  objects.reserve(env.config->objects.size());
  for (const auto& entry : env.config->objects) {
    objects.push_back(&entry.second);
  }
  std::ranges::sort(
      objects, {}, [](const config::ObjectConfig* object) {
        return object->name;
      });

  for (const config::ObjectConfig* object : objects) {
    std::optional<library::TypeId> owner = env.library->FindType(object->name);
    if (!owner) {
      sink->Warning(
          ElementPath{.path = object->name},
          "configured object is not part of the library");
      continue;
    }
    ReportUnmatchedFunctions(
        env, object->functions, *owner, object->name, *sink);
  }
  ReportUnmatchedFunctions(
      env, env.config->functions, library::TypeId::Invalid(),
      env.library->Namespace(), *sink);
  return result;
}

}  // namespace weft::analysis
