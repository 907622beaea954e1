#include "weft/analysis/array_length.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "weft/analysis/env.hpp"
#include "weft/analysis/parameter_set.hpp"
#include "weft/analysis/target_type.hpp"
#include "weft/common/name_util.hpp"
#include "weft/config/config.hpp"
#include "weft/library/library.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

using library::Fundamental;
using library::TypeKind;

auto NamesParameter(
    std::span<const library::Parameter> parameters, std::string_view name)
    -> bool {
  return std::ranges::any_of(parameters, [&](const library::Parameter& par) {
    return par.name == name || common::MangleKeywords(par.name) == name;
  });
}

}  // namespace

auto BuildArrayLengthIndex(std::span<const library::Parameter> parameters)
    -> ArrayLengthIndex {
  ArrayLengthIndex index;
  for (const library::Parameter& par : parameters) {
    // Arrays sharing one length parameter: the last one declared wins.
    if (par.array_length) {
      index.insert_or_assign(*par.array_length, par.name);
    }
  }
  return index;
}

auto IsLengthCandidate(const library::Parameter& par) -> bool {
  if (par.direction != library::ParameterDirection::kIn) {
    return false;
  }
  std::string_view name = par.name;
  return name.ends_with("len") || name.find("length") != std::string_view::npos;
}

auto HasLength(const Env& env, library::TypeId type) -> bool {
  const library::Type& info = env.TypeOf(env.library->ResolveAlias(type));
  switch (info.Kind()) {
    case TypeKind::kFundamental:
      switch (info.AsFundamental()) {
        case Fundamental::kUtf8:
        case Fundamental::kFilename:
        case Fundamental::kOsString:
          return true;
        default:
          return false;
      }
    case TypeKind::kCArray:
    case TypeKind::kFixedArray:
    case TypeKind::kArray:
    case TypeKind::kPtrArray:
    case TypeKind::kList:
    case TypeKind::kSList:
    case TypeKind::kHashTable:
      return true;
    default:
      return false;
  }
}

auto DetectLength(
    const Env& env, size_t pos, std::span<const library::Parameter> parameters)
    -> std::optional<std::string> {
  if (pos == 0 || pos >= parameters.size()) {
    return std::nullopt;
  }
  if (!IsLengthCandidate(parameters[pos])) {
    return std::nullopt;
  }
  const library::Parameter& array = parameters[pos - 1];
  if (!HasLength(env, array.typ)) {
    return std::nullopt;
  }
  return array.name;
}

auto ResolveArrayName(
    const Env& env, size_t pos, std::span<const library::Parameter> parameters,
    const ArrayLengthIndex& back_links,
    std::span<const config::ParameterConfig* const> configured_parameters,
    bool disable_length_detect) -> std::optional<std::string> {
  std::optional<std::string> array_name;

  for (const config::ParameterConfig* configured : configured_parameters) {
    if (!configured->length_of) {
      continue;
    }
    if (NamesParameter(parameters, *configured->length_of)) {
      array_name = *configured->length_of;
    } else {
      spdlog::debug(
          "length_of '{}' for parameter '{}' names no parameter, ignored",
          *configured->length_of, parameters[pos].name);
    }
    break;
  }
  if (!array_name) {
    if (auto it = back_links.find(static_cast<uint32_t>(pos));
        it != back_links.end()) {
      array_name = it->second;
    }
  }
  if (!array_name && !disable_length_detect) {
    array_name = DetectLength(env, pos, parameters);
  }

  if (!array_name) {
    return std::nullopt;
  }
  return common::MangleKeywords(*array_name);
}

auto MakeLengthLink(
    const Env& env, std::string array_name, std::string length_name,
    library::TypeId length_type) -> LengthLink {
  return LengthLink{
      .array_name = std::move(array_name),
      .length_name = std::move(length_name),
      .length_type = TargetTypeString(env, length_type),
  };
}

}  // namespace weft::analysis
