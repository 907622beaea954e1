#include "weft/analysis/override_string_type.hpp"

#include <optional>
#include <span>

#include "weft/analysis/env.hpp"
#include "weft/config/config.hpp"
#include "weft/library/library.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

using library::Fundamental;

auto IsStringFundamental(const library::Type& info) -> bool {
  return info.IsFundamental(Fundamental::kUtf8) ||
         info.IsFundamental(Fundamental::kFilename) ||
         info.IsFundamental(Fundamental::kOsString);
}

auto ToFundamental(config::StringType string_type) -> Fundamental {
  switch (string_type) {
    case config::StringType::kUtf8:
      return Fundamental::kUtf8;
    case config::StringType::kFilename:
      return Fundamental::kFilename;
    case config::StringType::kOsString:
      return Fundamental::kOsString;
  }
  return Fundamental::kUtf8;
}

}  // namespace

auto OverrideStringTypeParameter(
    const Env& env, library::TypeId type,
    std::span<const config::ParameterConfig* const> configured_parameters)
    -> library::TypeId {
  std::optional<config::StringType> string_type;
  for (const config::ParameterConfig* par : configured_parameters) {
    if (par->string_type) {
      string_type = par->string_type;
      break;
    }
  }
  if (!string_type) {
    return type;
  }

  library::TypeId replace =
      env.library->FundamentalType(ToFundamental(*string_type));
  const library::Type& info = env.TypeOf(type);
  if (IsStringFundamental(info)) {
    return replace;
  }
  if (info.Kind() == library::TypeKind::kCArray &&
      IsStringFundamental(env.TypeOf(info.AsContainer().element))) {
    return env.library
        ->FindContainer(
            library::TypeKind::kCArray,
            library::ContainerInfo{.element = replace})
        .value_or(type);
  }
  return type;
}

}  // namespace weft::analysis
