#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "weft/analysis/env.hpp"
#include "weft/config/config.hpp"
#include "weft/library/library.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::test {

using library::Fundamental;
using library::ParameterDirection;
using library::TypeId;
using library::TypeKind;

// In-memory library for analysis tests, with helpers to register the
// common type shapes under the "Demo" namespace.
class TestLibrary {
 public:
  TestLibrary() = default;

  auto Basic(library::Fundamental fundamental) const -> TypeId {
    return library_.FundamentalType(fundamental);
  }

  auto Class(std::string name, std::string c_type, bool final_type = false)
      -> TypeId {
    return library_.AddNamedType(
        TypeKind::kClass,
        library::ClassInfo{
            .named = {.name = std::move(name), .c_type = std::move(c_type)},
            .final_type = final_type});
  }

  auto Record(std::string name, std::string c_type, bool refcounted = false)
      -> TypeId {
    return library_.AddNamedType(
        TypeKind::kRecord,
        library::RecordInfo{
            .named = {.name = std::move(name), .c_type = std::move(c_type)},
            .refcounted = refcounted});
  }

  auto Named(TypeKind kind, std::string name, std::string c_type) -> TypeId {
    return library_.AddNamedType(
        kind,
        library::NamedInfo{.name = std::move(name), .c_type = std::move(c_type)});
  }

  auto Alias(std::string name, std::string c_type, TypeId target) -> TypeId {
    return library_.AddNamedType(
        TypeKind::kAlias,
        library::AliasInfo{
            .named = {.name = std::move(name), .c_type = std::move(c_type)},
            .target = target});
  }

  auto Container(TypeKind kind, TypeId element) -> TypeId {
    return library_.InternContainer(
        kind, library::ContainerInfo{.element = element});
  }

  auto CArray(TypeId element) -> TypeId {
    return Container(TypeKind::kCArray, element);
  }

  // Replace the configuration; throws on a parse error.
  void Configure(std::string_view toml) {
    auto parsed = config::ParseConfig(toml, "test.toml");
    if (!parsed) {
      throw std::runtime_error(parsed.error().primary.message);
    }
    config_ = std::move(*parsed);
  }

  auto GetEnv() const -> analysis::Env {
    return analysis::Env{.library = &library_, .config = &config_};
  }

  auto Lib() -> library::Library& {
    return library_;
  }

 private:
  library::Library library_{"Demo"};
  config::Config config_;
};

inline auto MakeParameter(
    std::string name, TypeId typ, std::string c_type,
    ParameterDirection direction = ParameterDirection::kIn)
    -> library::Parameter {
  library::Parameter par;
  par.name = std::move(name);
  par.typ = typ;
  par.c_type = std::move(c_type);
  par.direction = direction;
  return par;
}

inline auto MakeInstance(TypeId typ, std::string c_type)
    -> library::Parameter {
  library::Parameter par = MakeParameter("self", typ, std::move(c_type));
  par.instance_parameter = true;
  return par;
}

}  // namespace weft::test
