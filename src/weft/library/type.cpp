#include "weft/library/type.hpp"

#include <string>
#include <variant>

#include <fmt/core.h>

#include "weft/common/internal_error.hpp"

namespace weft::library {

namespace {

const std::string kEmpty;

}  // namespace

auto Type::AsFundamental() const -> Fundamental {
  if (kind_ != TypeKind::kFundamental) {
    throw common::InternalError(
        "Type::AsFundamental",
        fmt::format("expected fundamental, got {}", ToString(kind_)));
  }
  return std::get<FundamentalInfo>(payload_).fundamental;
}

auto Type::AsAlias() const -> const AliasInfo& {
  if (kind_ != TypeKind::kAlias) {
    throw common::InternalError(
        "Type::AsAlias", fmt::format("expected alias, got {}", ToString(kind_)));
  }
  return std::get<AliasInfo>(payload_);
}

auto Type::AsRecord() const -> const RecordInfo& {
  if (kind_ != TypeKind::kRecord) {
    throw common::InternalError(
        "Type::AsRecord",
        fmt::format("expected record, got {}", ToString(kind_)));
  }
  return std::get<RecordInfo>(payload_);
}

auto Type::AsClass() const -> const ClassInfo& {
  if (kind_ != TypeKind::kClass) {
    throw common::InternalError(
        "Type::AsClass", fmt::format("expected class, got {}", ToString(kind_)));
  }
  return std::get<ClassInfo>(payload_);
}

auto Type::AsContainer() const -> const ContainerInfo& {
  if (!std::holds_alternative<ContainerInfo>(payload_)) {
    throw common::InternalError(
        "Type::AsContainer",
        fmt::format("expected container, got {}", ToString(kind_)));
  }
  return std::get<ContainerInfo>(payload_);
}

auto Type::AsFixedArray() const -> const FixedArrayInfo& {
  if (kind_ != TypeKind::kFixedArray) {
    throw common::InternalError(
        "Type::AsFixedArray",
        fmt::format("expected fixed array, got {}", ToString(kind_)));
  }
  return std::get<FixedArrayInfo>(payload_);
}

auto Type::AsHashTable() const -> const HashTableInfo& {
  if (kind_ != TypeKind::kHashTable) {
    throw common::InternalError(
        "Type::AsHashTable",
        fmt::format("expected hash table, got {}", ToString(kind_)));
  }
  return std::get<HashTableInfo>(payload_);
}

auto Type::Name() const -> const std::string& {
  if (const auto* named = std::get_if<NamedInfo>(&payload_)) {
    return named->name;
  }
  if (const auto* alias = std::get_if<AliasInfo>(&payload_)) {
    return alias->named.name;
  }
  if (const auto* record = std::get_if<RecordInfo>(&payload_)) {
    return record->named.name;
  }
  if (const auto* klass = std::get_if<ClassInfo>(&payload_)) {
    return klass->named.name;
  }
  return kEmpty;
}

auto Type::CType() const -> const std::string& {
  if (const auto* named = std::get_if<NamedInfo>(&payload_)) {
    return named->c_type;
  }
  if (const auto* alias = std::get_if<AliasInfo>(&payload_)) {
    return alias->named.c_type;
  }
  if (const auto* record = std::get_if<RecordInfo>(&payload_)) {
    return record->named.c_type;
  }
  if (const auto* klass = std::get_if<ClassInfo>(&payload_)) {
    return klass->named.c_type;
  }
  return kEmpty;
}

auto Type::IsFinalType() const -> bool {
  switch (kind_) {
    case TypeKind::kClass:
      return AsClass().final_type;
    case TypeKind::kInterface:
      return false;
    default:
      return true;
  }
}

auto ToString(TypeKind kind) -> const char* {
  switch (kind) {
    case TypeKind::kFundamental:
      return "fundamental";
    case TypeKind::kAlias:
      return "alias";
    case TypeKind::kEnumeration:
      return "enumeration";
    case TypeKind::kBitfield:
      return "bitfield";
    case TypeKind::kRecord:
      return "record";
    case TypeKind::kUnion:
      return "union";
    case TypeKind::kClass:
      return "class";
    case TypeKind::kInterface:
      return "interface";
    case TypeKind::kCallback:
      return "callback";
    case TypeKind::kCArray:
      return "c_array";
    case TypeKind::kFixedArray:
      return "fixed_array";
    case TypeKind::kArray:
      return "array";
    case TypeKind::kPtrArray:
      return "ptr_array";
    case TypeKind::kList:
      return "list";
    case TypeKind::kSList:
      return "slist";
    case TypeKind::kHashTable:
      return "hash_table";
  }
  return "unknown";
}

// Names follow the interface-description spelling so manifests can use
// them directly.
auto ToString(Fundamental fundamental) -> const char* {
  switch (fundamental) {
    case Fundamental::kNone:
      return "none";
    case Fundamental::kBoolean:
      return "gboolean";
    case Fundamental::kInt8:
      return "gint8";
    case Fundamental::kUInt8:
      return "guint8";
    case Fundamental::kInt16:
      return "gint16";
    case Fundamental::kUInt16:
      return "guint16";
    case Fundamental::kInt32:
      return "gint32";
    case Fundamental::kUInt32:
      return "guint32";
    case Fundamental::kInt64:
      return "gint64";
    case Fundamental::kUInt64:
      return "guint64";
    case Fundamental::kChar:
      return "gchar";
    case Fundamental::kUChar:
      return "guchar";
    case Fundamental::kShort:
      return "gshort";
    case Fundamental::kUShort:
      return "gushort";
    case Fundamental::kInt:
      return "gint";
    case Fundamental::kUInt:
      return "guint";
    case Fundamental::kLong:
      return "glong";
    case Fundamental::kULong:
      return "gulong";
    case Fundamental::kSize:
      return "gsize";
    case Fundamental::kSSize:
      return "gssize";
    case Fundamental::kIntPtr:
      return "gintptr";
    case Fundamental::kUIntPtr:
      return "guintptr";
    case Fundamental::kFloat:
      return "gfloat";
    case Fundamental::kDouble:
      return "gdouble";
    case Fundamental::kPointer:
      return "gpointer";
    case Fundamental::kVarArgs:
      return "va_list";
    case Fundamental::kUniChar:
      return "gunichar";
    case Fundamental::kUtf8:
      return "utf8";
    case Fundamental::kFilename:
      return "filename";
    case Fundamental::kOsString:
      return "os_string";
    case Fundamental::kType:
      return "GType";
    case Fundamental::kUnsupported:
      return "unsupported";
  }
  return "unsupported";
}

auto FundamentalCType(Fundamental fundamental) -> const char* {
  switch (fundamental) {
    case Fundamental::kNone:
      return "void";
    case Fundamental::kVarArgs:
      return "va_list";
    case Fundamental::kUtf8:
    case Fundamental::kFilename:
    case Fundamental::kOsString:
      return "gchar*";
    case Fundamental::kUnsupported:
      return "";
    default:
      return ToString(fundamental);
  }
}

}  // namespace weft::library
