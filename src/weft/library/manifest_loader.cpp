#include "weft/library/manifest_loader.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/library/function.hpp"
#include "weft/library/library.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::library {

namespace {

class ManifestReader {
 public:
  explicit ManifestReader(std::string origin) : origin_(std::move(origin)) {
  }

  auto Read(const YAML::Node& root) -> Library;

 private:
  [[noreturn]] void Fail(const YAML::Node& node, const std::string& msg) const {
    throw DiagnosticException(
        Diagnostic::HostError(
            FileLocation{
                .file = origin_,
                .line = static_cast<uint32_t>(node.Mark().line + 1)},
            msg));
  }

  void ValidateKeys(
      const YAML::Node& node, std::initializer_list<std::string_view> allowed,
      std::string_view context) const {
    if (!node.IsMap()) {
      Fail(node, fmt::format("{} must be a mapping", context));
    }
    for (const auto& pair : node) {
      auto key = pair.first.as<std::string>();
      if (std::ranges::find(allowed, key) == allowed.end()) {
        Fail(pair.first, fmt::format("unknown field '{}' in {}", key, context));
      }
    }
  }

  auto Qualify(const std::string& name) const -> std::string {
    if (name.find('.') != std::string::npos) {
      return name;
    }
    return fmt::format("{}.{}", library_->Namespace(), name);
  }

  void DeclareTypes(const YAML::Node& types);
  void DeclareAliases(const std::vector<YAML::Node>& aliases);
  auto ReadTypeRef(const YAML::Node& node) -> TypeId;
  auto ReadFunction(const YAML::Node& node) -> Function;
  auto ReadParameter(
      const YAML::Node& node, ParameterDirection default_direction,
      std::string_view context) -> Parameter;
  void CheckIndex(
      const YAML::Node& node, const std::optional<uint32_t>& index,
      size_t count, std::string_view what) const;

  std::string origin_;
  Library* library_ = nullptr;
};

auto ParseKind(std::string_view kind) -> std::optional<TypeKind> {
  if (kind == "alias") return TypeKind::kAlias;
  if (kind == "enumeration" || kind == "enum") return TypeKind::kEnumeration;
  if (kind == "bitfield") return TypeKind::kBitfield;
  if (kind == "record") return TypeKind::kRecord;
  if (kind == "union") return TypeKind::kUnion;
  if (kind == "class") return TypeKind::kClass;
  if (kind == "interface") return TypeKind::kInterface;
  if (kind == "callback") return TypeKind::kCallback;
  return std::nullopt;
}

auto ParseDirection(std::string_view text) -> std::optional<ParameterDirection> {
  if (text == "in") return ParameterDirection::kIn;
  if (text == "out") return ParameterDirection::kOut;
  if (text == "inout") return ParameterDirection::kInOut;
  return std::nullopt;
}

auto ParseTransfer(std::string_view text) -> std::optional<Transfer> {
  if (text == "none") return Transfer::kNone;
  if (text == "container") return Transfer::kContainer;
  if (text == "full") return Transfer::kFull;
  return std::nullopt;
}

auto ParseScope(std::string_view text) -> std::optional<ParameterScope> {
  if (text == "call") return ParameterScope::kCall;
  if (text == "async") return ParameterScope::kAsync;
  if (text == "notified") return ParameterScope::kNotified;
  if (text == "forever") return ParameterScope::kForever;
  return std::nullopt;
}

auto OptionalIndex(const YAML::Node& node) -> std::optional<uint32_t> {
  if (!node) {
    return std::nullopt;
  }
  return node.as<uint32_t>();
}

auto ManifestReader::Read(const YAML::Node& root) -> Library {
  ValidateKeys(root, {"namespace", "types", "functions"}, "manifest root");
  if (!root["namespace"]) {
    Fail(root, "missing required field 'namespace'");
  }
  Library library(root["namespace"].as<std::string>());
  library_ = &library;

  if (root["types"]) {
    DeclareTypes(root["types"]);
  }
  if (root["functions"]) {
    for (const auto& node : root["functions"]) {
      library.AddFunction(ReadFunction(node));
    }
  }

  spdlog::debug(
      "loaded manifest {}: {} types, {} functions", origin_,
      library.TypeCount(), library.Functions().size());
  library_ = nullptr;
  return library;
}

void ManifestReader::DeclareTypes(const YAML::Node& types) {
  std::vector<YAML::Node> aliases;
  for (const auto& node : types) {
    ValidateKeys(
        node, {"name", "kind", "c_type", "target", "final", "refcounted"},
        "type entry");
    if (!node["name"] || !node["kind"]) {
      Fail(node, "type entry needs 'name' and 'kind'");
    }
    auto kind_text = node["kind"].as<std::string>();
    auto kind = ParseKind(kind_text);
    if (!kind) {
      Fail(node["kind"], fmt::format("unknown type kind '{}'", kind_text));
    }
    if (*kind == TypeKind::kAlias) {
      aliases.push_back(node);
      continue;
    }

    NamedInfo named{
        .name = Qualify(node["name"].as<std::string>()),
        .c_type = node["c_type"].as<std::string>(""),
    };
    if (library_->FindType(named.name)) {
      Fail(node, fmt::format("type '{}' declared twice", named.name));
    }

    switch (*kind) {
      case TypeKind::kRecord:
        library_->AddNamedType(
            *kind, RecordInfo{
                       .named = std::move(named),
                       .refcounted = node["refcounted"].as<bool>(false)});
        break;
      case TypeKind::kClass:
        library_->AddNamedType(
            *kind, ClassInfo{
                       .named = std::move(named),
                       .final_type = node["final"].as<bool>(false)});
        break;
      default:
        library_->AddNamedType(*kind, std::move(named));
        break;
    }
  }
  DeclareAliases(aliases);
}

// Aliases may name each other in any order; keep sweeping until every
// alias has a resolvable target.
void ManifestReader::DeclareAliases(const std::vector<YAML::Node>& aliases) {
  std::vector<YAML::Node> pending = aliases;
  while (!pending.empty()) {
    std::vector<YAML::Node> retry;
    for (const auto& node : pending) {
      if (!node["target"]) {
        Fail(node, "alias needs a 'target'");
      }
      auto target_name = node["target"].as<std::string>();
      auto target = library_->FindType(target_name);
      if (!target) {
        retry.push_back(node);
        continue;
      }
      auto name = Qualify(node["name"].as<std::string>());
      if (library_->FindType(name)) {
        Fail(node, fmt::format("type '{}' declared twice", name));
      }
      library_->AddNamedType(
          TypeKind::kAlias,
          AliasInfo{
              .named = {.name = name, .c_type = node["c_type"].as<std::string>("")},
              .target = *target});
    }
    if (retry.size() == pending.size()) {
      const auto& node = retry.front();
      Fail(
          node["target"],
          fmt::format(
              "alias '{}' targets unknown type '{}'",
              node["name"].as<std::string>(), node["target"].as<std::string>()));
    }
    pending = std::move(retry);
  }
}

auto ManifestReader::ReadTypeRef(const YAML::Node& node) -> TypeId {
  if (node.IsScalar()) {
    auto name = node.as<std::string>();
    auto id = library_->FindType(name);
    if (!id) {
      Fail(node, fmt::format("unknown type '{}'", name));
    }
    return *id;
  }
  if (!node.IsMap()) {
    Fail(node, "type must be a name or a container mapping");
  }

  auto container = [&](const char* key, TypeKind kind) -> std::optional<TypeId> {
    if (!node[key]) {
      return std::nullopt;
    }
    ValidateKeys(node, {key}, key);
    return library_->InternContainer(
        kind, ContainerInfo{.element = ReadTypeRef(node[key])});
  };
  if (auto id = container("c_array", TypeKind::kCArray)) return *id;
  if (auto id = container("array", TypeKind::kArray)) return *id;
  if (auto id = container("ptr_array", TypeKind::kPtrArray)) return *id;
  if (auto id = container("list", TypeKind::kList)) return *id;
  if (auto id = container("slist", TypeKind::kSList)) return *id;

  if (node["fixed_array"]) {
    ValidateKeys(node, {"fixed_array", "size"}, "fixed_array");
    return library_->InternContainer(
        TypeKind::kFixedArray,
        FixedArrayInfo{
            .element = ReadTypeRef(node["fixed_array"]),
            .size = node["size"].as<uint32_t>(0)});
  }
  if (node["hash_table"]) {
    ValidateKeys(node, {"hash_table"}, "hash_table");
    const auto& pair = node["hash_table"];
    if (!pair.IsSequence() || pair.size() != 2) {
      Fail(pair, "hash_table needs [key, value]");
    }
    return library_->InternContainer(
        TypeKind::kHashTable,
        HashTableInfo{.key = ReadTypeRef(pair[0]), .value = ReadTypeRef(pair[1])});
  }
  Fail(node, "unknown container type");
}

auto ManifestReader::ReadParameter(
    const YAML::Node& node, ParameterDirection default_direction,
    std::string_view context) -> Parameter {
  ValidateKeys(
      node,
      {"name", "type", "c_type", "direction", "nullable", "allow_none",
       "transfer", "caller_allocates", "scope", "array_length", "closure",
       "destroy", "error", "instance"},
      context);
  if (!node["type"]) {
    Fail(node, fmt::format("{} needs a 'type'", context));
  }

  Parameter par;
  par.name = node["name"].as<std::string>("");
  par.typ = ReadTypeRef(node["type"]);
  par.c_type = node["c_type"].as<std::string>("");
  if (par.c_type.empty()) {
    const Type& type = (*library_)[par.typ];
    par.c_type = type.Kind() == TypeKind::kFundamental
                     ? FundamentalCType(type.AsFundamental())
                     : type.CType();
  }

  par.direction = default_direction;
  if (node["direction"]) {
    auto text = node["direction"].as<std::string>();
    auto direction = ParseDirection(text);
    if (!direction || default_direction == ParameterDirection::kReturn) {
      Fail(node["direction"], fmt::format("invalid direction '{}'", text));
    }
    par.direction = *direction;
  }
  if (node["transfer"]) {
    auto text = node["transfer"].as<std::string>();
    auto transfer = ParseTransfer(text);
    if (!transfer) {
      Fail(node["transfer"], fmt::format("invalid transfer '{}'", text));
    }
    par.transfer = *transfer;
  }
  if (node["scope"]) {
    auto text = node["scope"].as<std::string>();
    auto scope = ParseScope(text);
    if (!scope) {
      Fail(node["scope"], fmt::format("invalid scope '{}'", text));
    }
    par.scope = *scope;
  }

  par.nullable = node["nullable"].as<bool>(false);
  par.allow_none = node["allow_none"].as<bool>(par.nullable);
  par.caller_allocates = node["caller_allocates"].as<bool>(false);
  par.array_length = OptionalIndex(node["array_length"]);
  par.closure = OptionalIndex(node["closure"]);
  par.destroy = OptionalIndex(node["destroy"]);
  par.is_error = node["error"].as<bool>(false);
  par.instance_parameter = node["instance"].as<bool>(false);
  return par;
}

void ManifestReader::CheckIndex(
    const YAML::Node& node, const std::optional<uint32_t>& index, size_t count,
    std::string_view what) const {
  if (index && *index >= count) {
    Fail(
        node,
        fmt::format(
            "{} index {} out of range ({} parameters)", what, *index, count));
  }
}

auto ManifestReader::ReadFunction(const YAML::Node& node) -> Function {
  ValidateKeys(
      node,
      {"name", "c_identifier", "owner", "throws", "finish_func", "return",
       "parameters"},
      "function entry");
  if (!node["name"]) {
    Fail(node, "function entry needs a 'name'");
  }

  Function function;
  function.name = node["name"].as<std::string>();
  function.c_identifier = node["c_identifier"].as<std::string>(function.name);
  if (node["owner"]) {
    auto owner_name = node["owner"].as<std::string>();
    auto owner = library_->FindType(owner_name);
    if (!owner) {
      Fail(node["owner"], fmt::format("unknown owner type '{}'", owner_name));
    }
    function.owner = *owner;
  }
  function.throws = node["throws"].as<bool>(false);
  if (node["finish_func"]) {
    function.finish_func = node["finish_func"].as<std::string>();
  }

  auto context = fmt::format("parameter of '{}'", function.c_identifier);
  if (node["parameters"]) {
    for (const auto& par_node : node["parameters"]) {
      function.parameters.push_back(
          ReadParameter(par_node, ParameterDirection::kIn, context));
    }
  }
  if (node["return"]) {
    function.ret = ReadParameter(
        node["return"], ParameterDirection::kReturn,
        fmt::format("return of '{}'", function.c_identifier));
  }

  size_t count = function.parameters.size();
  size_t pos = 0;
  for (const auto& par_node : node["parameters"]) {
    const Parameter& par = function.parameters[pos++];
    CheckIndex(par_node, par.array_length, count, "array_length");
    CheckIndex(par_node, par.closure, count, "closure");
    CheckIndex(par_node, par.destroy, count, "destroy");
  }
  if (function.ret) {
    CheckIndex(node["return"], function.ret->array_length, count, "array_length");
  }
  return function;
}

}  // namespace

auto ParseManifest(std::string_view text, std::string_view origin)
    -> Result<Library> {
  try {
    // NOLINTNEXTLINE(misc-include-cleaner): Load is provided by yaml.h
    auto root = YAML::Load(std::string(text));
    ManifestReader reader{std::string(origin)};
    return reader.Read(root);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            FileLocation{
                .file = std::string(origin),
                .line = static_cast<uint32_t>(e.mark.line + 1)},
            fmt::format("malformed manifest: {}", e.msg)));
  }
}

auto LoadManifest(const std::filesystem::path& path) -> Result<Library> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open manifest '{}'", path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ParseManifest(buffer.str(), path.string());
}

}  // namespace weft::library
