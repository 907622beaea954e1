#include "weft/analysis/target_type.hpp"

#include <cctype>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "weft/analysis/env.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/common/name_util.hpp"
#include "weft/library/library.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

using library::Fundamental;
using library::TypeKind;

auto FundamentalName(Fundamental fundamental) -> const char* {
  switch (fundamental) {
    case Fundamental::kNone:
      return "()";
    case Fundamental::kBoolean:
      return "bool";
    case Fundamental::kInt8:
    case Fundamental::kChar:
      return "i8";
    case Fundamental::kUInt8:
    case Fundamental::kUChar:
      return "u8";
    case Fundamental::kInt16:
    case Fundamental::kShort:
      return "i16";
    case Fundamental::kUInt16:
    case Fundamental::kUShort:
      return "u16";
    case Fundamental::kInt32:
    case Fundamental::kInt:
      return "i32";
    case Fundamental::kUInt32:
    case Fundamental::kUInt:
      return "u32";
    case Fundamental::kInt64:
      return "i64";
    case Fundamental::kUInt64:
      return "u64";
    case Fundamental::kLong:
      return "libc::c_long";
    case Fundamental::kULong:
      return "libc::c_ulong";
    case Fundamental::kSize:
    case Fundamental::kUIntPtr:
      return "usize";
    case Fundamental::kSSize:
    case Fundamental::kIntPtr:
      return "isize";
    case Fundamental::kFloat:
      return "f32";
    case Fundamental::kDouble:
      return "f64";
    case Fundamental::kPointer:
      return "glib::ffi::gpointer";
    case Fundamental::kUniChar:
      return "char";
    case Fundamental::kUtf8:
      return "glib::GString";
    case Fundamental::kFilename:
      return "std::path::PathBuf";
    case Fundamental::kOsString:
      return "std::ffi::OsString";
    case Fundamental::kType:
      return "glib::types::Type";
    case Fundamental::kVarArgs:
    case Fundamental::kUnsupported:
      return nullptr;
  }
  return nullptr;
}

auto ModuleName(std::string_view ns) -> std::string {
  std::string module;
  module.reserve(ns.size());
  for (char c : ns) {
    module.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return module;
}

auto Unsupported(const Env& env, library::TypeId type) -> Diagnostic {
  return Diagnostic::Error(
      ElementPath{.path = env.library->FullName(type)},
      "type has no binding spelling");
}

auto NamedTypeName(const Env& env, const library::Type& info) -> std::string {
  const std::string& full_name = info.Name();
  auto dot = full_name.rfind('.');
  if (dot == std::string::npos) {
    return full_name;
  }
  std::string_view ns = std::string_view(full_name).substr(0, dot);
  std::string_view short_name = common::ShortName(full_name);
  if (ns == env.library->Namespace()) {
    return std::string(short_name);
  }
  return fmt::format("{}::{}", ModuleName(ns), short_name);
}

}  // namespace

auto TargetTypeName(const Env& env, library::TypeId type)
    -> Result<std::string> {
  const library::Type& info = env.TypeOf(type);
  switch (info.Kind()) {
    case TypeKind::kFundamental: {
      const char* name = FundamentalName(info.AsFundamental());
      if (name == nullptr) {
        return std::unexpected(Unsupported(env, type));
      }
      return std::string(name);
    }

    case TypeKind::kCallback:
      return std::unexpected(Unsupported(env, type));

    case TypeKind::kCArray:
    case TypeKind::kArray:
    case TypeKind::kPtrArray:
    case TypeKind::kList:
    case TypeKind::kSList: {
      auto element = TargetTypeName(env, info.AsContainer().element);
      if (!element) {
        return element;
      }
      return fmt::format("Vec<{}>", *element);
    }

    case TypeKind::kFixedArray: {
      const auto& array = info.AsFixedArray();
      auto element = TargetTypeName(env, array.element);
      if (!element) {
        return element;
      }
      return fmt::format("[{}; {}]", *element, array.size);
    }

    case TypeKind::kHashTable: {
      const auto& table = info.AsHashTable();
      auto key = TargetTypeName(env, table.key);
      if (!key) {
        return key;
      }
      auto value = TargetTypeName(env, table.value);
      if (!value) {
        return value;
      }
      return fmt::format("std::collections::HashMap<{}, {}>", *key, *value);
    }

    default:
      return NamedTypeName(env, info);
  }
}

auto TargetTypeString(const Env& env, library::TypeId type) -> std::string {
  auto name = TargetTypeName(env, type);
  if (name) {
    return *name;
  }
  return fmt::format("/*Unimplemented*/{}", env.library->FullName(type));
}

}  // namespace weft::analysis
