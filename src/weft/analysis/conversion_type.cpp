#include "weft/analysis/conversion_type.hpp"

#include <optional>
#include <string_view>

#include "weft/analysis/env.hpp"
#include "weft/library/library.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

using library::Fundamental;
using library::TypeKind;

// Alias chains longer than this are treated as cyclic.
constexpr int kMaxAliasDepth = 64;

auto ClassifyFundamental(Fundamental fundamental) -> ConversionType {
  switch (fundamental) {
    case Fundamental::kBoolean:
    case Fundamental::kUniChar:
    case Fundamental::kType:
      return ConversionType::kScalar;

    case Fundamental::kInt8:
    case Fundamental::kUInt8:
    case Fundamental::kInt16:
    case Fundamental::kUInt16:
    case Fundamental::kInt32:
    case Fundamental::kUInt32:
    case Fundamental::kInt64:
    case Fundamental::kUInt64:
    case Fundamental::kChar:
    case Fundamental::kUChar:
    case Fundamental::kShort:
    case Fundamental::kUShort:
    case Fundamental::kInt:
    case Fundamental::kUInt:
    case Fundamental::kLong:
    case Fundamental::kULong:
    case Fundamental::kSize:
    case Fundamental::kSSize:
    case Fundamental::kIntPtr:
    case Fundamental::kUIntPtr:
    case Fundamental::kFloat:
    case Fundamental::kDouble:
      return ConversionType::kDirect;

    case Fundamental::kPointer:
    case Fundamental::kUtf8:
    case Fundamental::kFilename:
    case Fundamental::kOsString:
      return ConversionType::kPointer;

    case Fundamental::kNone:
    case Fundamental::kVarArgs:
    case Fundamental::kUnsupported:
      return ConversionType::kUnknown;
  }
  return ConversionType::kUnknown;
}

}  // namespace

auto ClassifyConversion(const Env& env, library::TypeId type)
    -> ConversionType {
  // Alias chains are followed iteratively so a configured override on any
  // link of the chain is honored.
  for (int depth = 0; depth < kMaxAliasDepth; ++depth) {
    if (type.value >= env.library->TypeCount()) {
      return ConversionType::kUnknown;
    }
    if (const auto* object = env.FindObjectConfig(type)) {
      if (object->conversion_type) {
        return *object->conversion_type;
      }
    }

    const library::Type& info = env.TypeOf(type);
    switch (info.Kind()) {
      case TypeKind::kFundamental:
        return ClassifyFundamental(info.AsFundamental());

      case TypeKind::kAlias:
        // Quarks are interned strings passed around as plain integers.
        if (info.CType() == "GQuark") {
          return ConversionType::kScalar;
        }
        type = info.AsAlias().target;
        continue;

      case TypeKind::kEnumeration:
      case TypeKind::kBitfield:
        return ConversionType::kScalar;

      case TypeKind::kCallback:
        return ConversionType::kDirect;

      case TypeKind::kRecord:
      case TypeKind::kUnion:
      case TypeKind::kClass:
      case TypeKind::kInterface:
      case TypeKind::kCArray:
      case TypeKind::kFixedArray:
      case TypeKind::kArray:
      case TypeKind::kPtrArray:
      case TypeKind::kList:
      case TypeKind::kSList:
      case TypeKind::kHashTable:
        return ConversionType::kPointer;
    }
    return ConversionType::kUnknown;
  }
  return ConversionType::kUnknown;
}

auto ToString(ConversionType conversion) -> const char* {
  switch (conversion) {
    case ConversionType::kDirect:
      return "direct";
    case ConversionType::kScalar:
      return "scalar";
    case ConversionType::kPointer:
      return "pointer";
    case ConversionType::kBorrow:
      return "borrow";
    case ConversionType::kUnknown:
      return "unknown";
  }
  return "unknown";
}

auto ParseConversionType(std::string_view text)
    -> std::optional<ConversionType> {
  if (text == "direct") return ConversionType::kDirect;
  if (text == "scalar") return ConversionType::kScalar;
  if (text == "pointer") return ConversionType::kPointer;
  if (text == "borrow") return ConversionType::kBorrow;
  if (text == "unknown") return ConversionType::kUnknown;
  return std::nullopt;
}

}  // namespace weft::analysis
