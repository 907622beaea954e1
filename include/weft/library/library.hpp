#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"
#include "weft/library/function.hpp"
#include "weft/library/type.hpp"

namespace weft::library {

struct TypeKey {
  TypeKind kind;
  TypePayload payload;

  auto operator==(const TypeKey&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const TypeKey& key) -> H {
    return H::combine(std::move(h), key.kind, key.payload);
  }
};

// Read-only type environment and function table of one native library.
// Populated once by the manifest loader (or a test), then shared between
// analyses without locking.
class Library final {
 public:
  explicit Library(std::string namespace_name);
  ~Library() = default;

  Library(const Library&) = delete;
  auto operator=(const Library&) -> Library& = delete;

  Library(Library&&) = default;
  auto operator=(Library&&) -> Library& = default;

  [[nodiscard]] auto Namespace() const -> const std::string& {
    return namespace_;
  }

  [[nodiscard]] auto FundamentalType(Fundamental fundamental) const -> TypeId;

  // Register a named type under its full dotted name. The name must not be
  // registered yet.
  auto AddNamedType(TypeKind kind, TypePayload payload) -> TypeId;

  // Intern an anonymous container type. Idempotent.
  auto InternContainer(TypeKind kind, TypePayload payload) -> TypeId;

  // Look up an anonymous container without creating it.
  [[nodiscard]] auto FindContainer(TypeKind kind, const TypePayload& payload)
      const -> std::optional<TypeId>;

  // Look up a type by full name, by name relative to this library's
  // namespace, or by fundamental name ("gint", "utf8", ...).
  [[nodiscard]] auto FindType(std::string_view name) const
      -> std::optional<TypeId>;

  [[nodiscard]] auto operator[](TypeId id) const -> const Type&;

  // Follow alias chains to the first non-alias type.
  [[nodiscard]] auto ResolveAlias(TypeId id) const -> TypeId;

  // Human readable name: full name for named types, fundamental name, or a
  // container spelling such as "c_array<utf8>".
  [[nodiscard]] auto FullName(TypeId id) const -> std::string;

  auto AddFunction(Function function) -> void;

  [[nodiscard]] auto Functions() const -> const std::vector<Function>& {
    return functions_;
  }

  [[nodiscard]] auto TypeCount() const -> size_t {
    return types_.size();
  }

 private:
  std::string namespace_;
  std::vector<Type> types_;
  std::vector<TypeId> fundamentals_;
  absl::flat_hash_map<std::string, TypeId> names_;
  absl::flat_hash_map<TypeKey, TypeId> containers_;
  std::vector<Function> functions_;
};

}  // namespace weft::library
