#include "weft/library/library.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "weft/common/internal_error.hpp"
#include "weft/library/type.hpp"

namespace weft::library {

namespace {

constexpr auto kLastFundamental = static_cast<uint8_t>(Fundamental::kUnsupported);

// Alias chains longer than this are treated as cyclic.
constexpr int kMaxAliasDepth = 64;

}  // namespace

Library::Library(std::string namespace_name)
    : namespace_(std::move(namespace_name)) {
  fundamentals_.reserve(kLastFundamental + 1);
  for (uint8_t i = 0; i <= kLastFundamental; ++i) {
    auto fundamental = static_cast<Fundamental>(i);
    TypeId id{static_cast<uint32_t>(types_.size())};
    types_.emplace_back(
        TypeKind::kFundamental, FundamentalInfo{.fundamental = fundamental});
    fundamentals_.push_back(id);
    names_.emplace(ToString(fundamental), id);
  }
}

auto Library::FundamentalType(Fundamental fundamental) const -> TypeId {
  return fundamentals_[static_cast<uint8_t>(fundamental)];
}

auto Library::AddNamedType(TypeKind kind, TypePayload payload) -> TypeId {
  Type type(kind, std::move(payload));
  const std::string& name = type.Name();
  if (name.empty()) {
    throw common::InternalError(
        "Library::AddNamedType",
        fmt::format("{} type registered without a name", ToString(kind)));
  }
  if (names_.contains(name)) {
    throw common::InternalError(
        "Library::AddNamedType",
        fmt::format("type '{}' registered twice", name));
  }
  TypeId id{static_cast<uint32_t>(types_.size())};
  names_.emplace(name, id);
  types_.push_back(std::move(type));
  return id;
}

auto Library::InternContainer(TypeKind kind, TypePayload payload) -> TypeId {
  TypeKey key{.kind = kind, .payload = payload};
  auto it = containers_.find(key);
  if (it != containers_.end()) {
    return it->second;
  }
  TypeId id{static_cast<uint32_t>(types_.size())};
  types_.emplace_back(kind, std::move(payload));
  containers_.emplace(std::move(key), id);
  return id;
}

auto Library::FindContainer(TypeKind kind, const TypePayload& payload) const
    -> std::optional<TypeId> {
  auto it = containers_.find(TypeKey{.kind = kind, .payload = payload});
  if (it == containers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto Library::FindType(std::string_view name) const -> std::optional<TypeId> {
  if (auto it = names_.find(name); it != names_.end()) {
    return it->second;
  }
  if (name.find('.') == std::string_view::npos) {
    auto qualified = fmt::format("{}.{}", namespace_, name);
    if (auto it = names_.find(qualified); it != names_.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

auto Library::operator[](TypeId id) const -> const Type& {
  if (id.value >= types_.size()) {
    throw common::InternalError(
        "Library::operator[]",
        fmt::format(
            "type id {} out of range ({} types)", id.value, types_.size()));
  }
  return types_[id.value];
}

auto Library::ResolveAlias(TypeId id) const -> TypeId {
  for (int depth = 0; depth < kMaxAliasDepth; ++depth) {
    const Type& type = (*this)[id];
    if (type.Kind() != TypeKind::kAlias) {
      return id;
    }
    id = type.AsAlias().target;
  }
  throw common::InternalError(
      "Library::ResolveAlias",
      fmt::format("alias chain through '{}' does not terminate", FullName(id)));
}

auto Library::FullName(TypeId id) const -> std::string {
  const Type& type = (*this)[id];
  switch (type.Kind()) {
    case TypeKind::kFundamental:
      return ToString(type.AsFundamental());
    case TypeKind::kCArray:
    case TypeKind::kArray:
    case TypeKind::kPtrArray:
    case TypeKind::kList:
    case TypeKind::kSList:
      return fmt::format(
          "{}<{}>", ToString(type.Kind()), FullName(type.AsContainer().element));
    case TypeKind::kFixedArray: {
      const auto& info = type.AsFixedArray();
      return fmt::format("fixed_array<{}, {}>", FullName(info.element), info.size);
    }
    case TypeKind::kHashTable: {
      const auto& info = type.AsHashTable();
      return fmt::format(
          "hash_table<{}, {}>", FullName(info.key), FullName(info.value));
    }
    default:
      return type.Name();
  }
}

auto Library::AddFunction(Function function) -> void {
  functions_.push_back(std::move(function));
}

}  // namespace weft::library
