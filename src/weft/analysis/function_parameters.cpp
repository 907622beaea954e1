#include "weft/analysis/function_parameters.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "weft/analysis/array_length.hpp"
#include "weft/analysis/async_params.hpp"
#include "weft/analysis/conversion_type.hpp"
#include "weft/analysis/env.hpp"
#include "weft/analysis/out_parameters.hpp"
#include "weft/analysis/override_string_type.hpp"
#include "weft/analysis/ownership.hpp"
#include "weft/analysis/parameter_set.hpp"
#include "weft/common/name_util.hpp"
#include "weft/config/config.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

using library::ParameterDirection;

// Default surface inclusion from the direction alone. Out parameters that
// can be returned move to the return value; async functions report their
// results through the future instead.
auto IncludeByDirection(
    const Env& env, const library::Parameter& par, bool is_async) -> bool {
  switch (par.direction) {
    case ParameterDirection::kIn:
    case ParameterDirection::kInOut:
      return true;
    case ParameterDirection::kReturn:
      return false;
    case ParameterDirection::kOut:
      return !CanAsReturn(env, par) && !is_async;
  }
  return false;
}

// Nullable objects are converted through a shared reference. Checked on
// the declared type, not the working one.
auto IsNullableObject(
    const Env& env, const library::Parameter& par,
    const ResolvedOwnership& ownership) -> bool {
  const library::Type& declared = env.TypeOf(par.typ);
  return !par.instance_parameter && ownership.nullable &&
         (declared.IsInterface() || declared.IsClass());
}

auto PrimaryTransformation(
    const Env& env, const library::Parameter& par, const std::string& name,
    const ResolvedOwnership& ownership, bool in_trait) -> TransformationKind {
  switch (ownership.conversion) {
    case ConversionType::kDirect:
      return ToNativeDirect{.name = name};
    case ConversionType::kScalar:
      return ToNativeScalar{.name = name, .nullable = ownership.nullable};
    case ConversionType::kPointer:
      return ToNativePointer{
          .name = name,
          .instance_parameter = par.instance_parameter,
          .transfer = ownership.transfer,
          .ref_mode = ownership.ref_mode,
          .to_native_extra = {},
          .explicit_target_type = {},
          .pointer_cast = {},
          .in_trait = in_trait,
          .nullable = IsNullableObject(env, par, ownership),
      };
    case ConversionType::kBorrow:
      return ToNativeBorrow{};
    case ConversionType::kUnknown:
      return ToNativeUnknown{.name = name};
  }
  return ToNativeUnknown{.name = name};
}

}  // namespace

auto LowerParameters(
    const Env& env, std::span<const library::Parameter> parameters,
    std::span<const config::FunctionConfig* const> configured_functions,
    const LowerOptions& options) -> ParameterSet {
  ParameterSet set;
  set.surface.reserve(parameters.size());
  set.native.reserve(parameters.size());
  set.transformations.reserve(parameters.size());

  ArrayLengthIndex back_links = BuildArrayLengthIndex(parameters);

  for (size_t pos = 0; pos < parameters.size(); ++pos) {
    const library::Parameter& par = parameters[pos];

    std::string name = par.instance_parameter
                           ? par.name
                           : common::MangleKeywords(par.name);
    auto configured_parameters =
        config::MatchedParameters(configured_functions, name);
    library::TypeId typ =
        OverrideStringTypeParameter(env, par.typ, configured_parameters);

    auto native_index = static_cast<uint32_t>(set.native.size());
    bool add_surface = IncludeByDirection(env, par, options.is_async);
    if (options.is_async && IsAsyncParamToRemove(par.name)) {
      add_surface = false;
    }

    std::optional<std::string> array_name = ResolveArrayName(
        env, pos, parameters, back_links, configured_parameters,
        options.disable_length_detect);
    if (array_name) {
      add_surface = false;
      spdlog::debug(
          "'{}' folded as length of '{}'", par.name, *array_name);
      set.transformations.push_back(
          Transformation{
              .native_index = native_index,
              .surface_index = std::nullopt,
              .kind = MakeLengthLink(env, *array_name, par.name, typ),
          });
    }

    ResolvedOwnership ownership = ResolveOwnership(
        env, par, typ, configured_parameters, options.in_trait);

    set.native.push_back(
        NativeParameter{
            .name = name,
            .typ = typ,
            .c_type = par.c_type,
            .instance_parameter = par.instance_parameter,
            .direction = par.direction,
            .nullable = ownership.nullable,
            .transfer = ownership.transfer,
            .caller_allocates = ownership.caller_allocates,
            .is_error = par.is_error,
            .scope = par.scope,
            .user_data_index = par.closure,
            .destroy_index = par.destroy,
            .ref_mode = ownership.ref_mode,
        });

    std::optional<uint32_t> surface_index;
    if (add_surface) {
      surface_index = static_cast<uint32_t>(set.surface.size());
      set.surface.push_back(
          SurfaceParameter{
              .native_index = native_index,
              .name = name,
              .typ = typ,
              .allow_none = par.allow_none,
          });
    }

    // The length link is the only step of a folded length parameter.
    if (array_name) {
      continue;
    }

    TransformationKind kind =
        PrimaryTransformation(env, par, name, ownership, options.in_trait);
    if (IsNullableObject(env, par, ownership) && !env.IsFinalType(par.typ)) {
      kind = WithToNativeExtra(kind, kAsRefExtra);
    }
    if (options.is_async) {
      kind = RestructureAsyncTransformation(std::move(kind));
    }
    set.transformations.push_back(
        Transformation{
            .native_index = native_index,
            .surface_index = surface_index,
            .kind = std::move(kind),
        });
  }

  return set;
}

}  // namespace weft::analysis
