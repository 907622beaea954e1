#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "absl/hash/hash.h"

namespace weft::library {

// Index into Library's type table.
struct TypeId {
  uint32_t value = UINT32_MAX;

  static constexpr auto Invalid() -> TypeId {
    return {UINT32_MAX};
  }
  [[nodiscard]] auto IsValid() const -> bool {
    return value != UINT32_MAX;
  }

  auto operator==(const TypeId&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, TypeId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

enum class Fundamental : uint8_t {
  kNone,
  kBoolean,
  kInt8,
  kUInt8,
  kInt16,
  kUInt16,
  kInt32,
  kUInt32,
  kInt64,
  kUInt64,
  kChar,
  kUChar,
  kShort,
  kUShort,
  kInt,
  kUInt,
  kLong,
  kULong,
  kSize,
  kSSize,
  kIntPtr,
  kUIntPtr,
  kFloat,
  kDouble,
  kPointer,
  kVarArgs,
  kUniChar,
  kUtf8,
  kFilename,
  kOsString,
  kType,
  kUnsupported,
};

enum class TypeKind : uint8_t {
  kFundamental,
  kAlias,
  kEnumeration,
  kBitfield,
  kRecord,
  kUnion,
  kClass,
  kInterface,
  kCallback,
  kCArray,
  kFixedArray,
  kArray,
  kPtrArray,
  kList,
  kSList,
  kHashTable,
};

struct FundamentalInfo {
  Fundamental fundamental;

  auto operator==(const FundamentalInfo&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const FundamentalInfo& info) -> H {
    return H::combine(std::move(h), info.fundamental);
  }
};

// Named types (alias, enum, bitfield, record, union, class, interface,
// callback) are identified by full name; they are never deduplicated.
struct NamedInfo {
  std::string name;    // Full dotted name, e.g. "Demo.Widget"
  std::string c_type;  // Native spelling, e.g. "DemoWidget"

  auto operator==(const NamedInfo&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const NamedInfo& info) -> H {
    return H::combine(std::move(h), info.name, info.c_type);
  }
};

struct AliasInfo {
  NamedInfo named;
  TypeId target;

  auto operator==(const AliasInfo&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const AliasInfo& info) -> H {
    return H::combine(std::move(h), info.named, info.target);
  }
};

struct RecordInfo {
  NamedInfo named;
  bool refcounted = false;  // Has ref/unref functions

  auto operator==(const RecordInfo&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const RecordInfo& info) -> H {
    return H::combine(std::move(h), info.named, info.refcounted);
  }
};

struct ClassInfo {
  NamedInfo named;
  bool final_type = false;

  auto operator==(const ClassInfo&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const ClassInfo& info) -> H {
    return H::combine(std::move(h), info.named, info.final_type);
  }
};

// Single-element containers: C array, GArray, GPtrArray, GList, GSList.
struct ContainerInfo {
  TypeId element;

  auto operator==(const ContainerInfo&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const ContainerInfo& info) -> H {
    return H::combine(std::move(h), info.element);
  }
};

struct FixedArrayInfo {
  TypeId element;
  uint32_t size = 0;

  auto operator==(const FixedArrayInfo&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const FixedArrayInfo& info) -> H {
    return H::combine(std::move(h), info.element, info.size);
  }
};

struct HashTableInfo {
  TypeId key;
  TypeId value;

  auto operator==(const HashTableInfo&) const -> bool = default;
  template <typename H>
  friend auto AbslHashValue(H h, const HashTableInfo& info) -> H {
    return H::combine(std::move(h), info.key, info.value);
  }
};

using TypePayload = std::variant<
    FundamentalInfo, NamedInfo, AliasInfo, RecordInfo, ClassInfo,
    ContainerInfo, FixedArrayInfo, HashTableInfo>;

class Type {
 public:
  Type(TypeKind kind, TypePayload payload)
      : kind_(kind), payload_(std::move(payload)) {
  }

  [[nodiscard]] auto Kind() const -> TypeKind {
    return kind_;
  }

  [[nodiscard]] auto AsFundamental() const -> Fundamental;
  [[nodiscard]] auto AsAlias() const -> const AliasInfo&;
  [[nodiscard]] auto AsRecord() const -> const RecordInfo&;
  [[nodiscard]] auto AsClass() const -> const ClassInfo&;
  [[nodiscard]] auto AsContainer() const -> const ContainerInfo&;
  [[nodiscard]] auto AsFixedArray() const -> const FixedArrayInfo&;
  [[nodiscard]] auto AsHashTable() const -> const HashTableInfo&;

  [[nodiscard]] auto IsFundamental(Fundamental fundamental) const -> bool {
    return kind_ == TypeKind::kFundamental && AsFundamental() == fundamental;
  }

  // Full dotted name for named types, empty for fundamentals and
  // containers.
  [[nodiscard]] auto Name() const -> const std::string&;

  // Native spelling for named types, empty otherwise.
  [[nodiscard]] auto CType() const -> const std::string&;

  [[nodiscard]] auto IsInterface() const -> bool {
    return kind_ == TypeKind::kInterface;
  }
  [[nodiscard]] auto IsClass() const -> bool {
    return kind_ == TypeKind::kClass;
  }

  // Classes report their declared flag, interfaces are never final, every
  // other kind cannot be subclassed and counts as final.
  [[nodiscard]] auto IsFinalType() const -> bool;

 private:
  TypeKind kind_;
  TypePayload payload_;
};

auto ToString(TypeKind kind) -> const char*;
auto ToString(Fundamental fundamental) -> const char*;

// Native spelling of a fundamental, e.g. "gint" or "gchar*".
auto FundamentalCType(Fundamental fundamental) -> const char*;

}  // namespace weft::library
