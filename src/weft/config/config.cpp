#include "weft/config/config.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "weft/analysis/conversion_type.hpp"
#include "weft/analysis/ref_mode.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"

namespace weft::config {

namespace fs = std::filesystem;

namespace {

class ConfigReader {
 public:
  explicit ConfigReader(std::string origin) : origin_(std::move(origin)) {
  }

  auto Read(const toml::table& root) -> Config;

 private:
  [[nodiscard]] auto Location(const toml::node& node) const -> FileLocation {
    return FileLocation{
        .file = origin_,
        .line = static_cast<uint32_t>(node.source().begin.line)};
  }

  [[noreturn]] void Fail(const toml::node& node, const std::string& msg) const {
    throw DiagnosticException(Diagnostic::HostError(Location(node), msg));
  }

  void ValidateKeys(
      const toml::table& table,
      std::initializer_list<std::string_view> allowed,
      std::string_view context) const {
    for (auto&& [key, value] : table) {
      if (std::ranges::find(allowed, key.str()) == allowed.end()) {
        throw DiagnosticException(
            Diagnostic::HostError(
                Location(value),
                fmt::format("unknown field '{}' in {}", key.str(), context))
                .WithNote(
                    fmt::format("allowed fields: {}", fmt::join(allowed, ", "))));
      }
    }
  }

  auto Tables(const toml::table& parent, std::string_view key)
      -> std::vector<const toml::table*> {
    std::vector<const toml::table*> result;
    const toml::node* node = parent.get(key);
    if (node == nullptr) {
      return result;
    }
    const toml::array* array = node->as_array();
    if (array == nullptr) {
      Fail(*node, fmt::format("'{}' must be an array of tables", key));
    }
    for (const toml::node& elem : *array) {
      const toml::table* table = elem.as_table();
      if (table == nullptr) {
        Fail(elem, fmt::format("'{}' entries must be tables", key));
      }
      result.push_back(table);
    }
    return result;
  }

  template <typename T>
  auto Optional(const toml::table& table, std::string_view key, const char* what)
      -> std::optional<T> {
    const toml::node* node = table.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    auto value = node->value<T>();
    if (!value) {
      Fail(*node, fmt::format("'{}' must be {}", key, what));
    }
    return value;
  }

  auto ReadIdent(const toml::table& table, std::string_view context) -> Ident;
  auto ReadFunction(const toml::table& table) -> FunctionConfig;
  auto ReadParameter(const toml::table& table) -> ParameterConfig;
  auto ReadObject(const toml::table& table) -> ObjectConfig;

  std::string origin_;
};

auto ParseStringType(std::string_view text) -> std::optional<StringType> {
  if (text == "utf8") return StringType::kUtf8;
  if (text == "filename") return StringType::kFilename;
  if (text == "os_string") return StringType::kOsString;
  return std::nullopt;
}

auto ConfigReader::ReadIdent(const toml::table& table, std::string_view context)
    -> Ident {
  auto name = Optional<std::string>(table, "name", "a string");
  auto pattern = Optional<std::string>(table, "pattern", "a string");
  if (name.has_value() == pattern.has_value()) {
    Fail(table, fmt::format("{} needs exactly one of 'name' or 'pattern'", context));
  }
  if (name) {
    return Ident::Name(*name);
  }
  auto ident = Ident::Pattern(*pattern);
  if (!ident) {
    Fail(*table.get("pattern"), ident.error().primary.message);
  }
  return *ident;
}

auto ConfigReader::ReadParameter(const toml::table& table) -> ParameterConfig {
  ValidateKeys(
      table, {"name", "pattern", "nullable", "const", "length_of", "string"},
      "parameter entry");
  ParameterConfig par{.ident = ReadIdent(table, "parameter entry")};
  par.nullable = Optional<bool>(table, "nullable", "a boolean");
  par.constant = Optional<bool>(table, "const", "a boolean").value_or(false);
  par.length_of = Optional<std::string>(table, "length_of", "a string");
  if (auto text = Optional<std::string>(table, "string", "a string")) {
    par.string_type = ParseStringType(*text);
    if (!par.string_type) {
      Fail(
          *table.get("string"),
          fmt::format(
              "unknown string type '{}', use 'utf8', 'filename' or 'os_string'",
              *text));
    }
  }
  return par;
}

auto ConfigReader::ReadFunction(const toml::table& table) -> FunctionConfig {
  ValidateKeys(
      table, {"name", "pattern", "disable_length_detect", "parameter"},
      "function entry");
  FunctionConfig function{.ident = ReadIdent(table, "function entry")};
  function.disable_length_detect =
      Optional<bool>(table, "disable_length_detect", "a boolean")
          .value_or(false);
  for (const toml::table* par : Tables(table, "parameter")) {
    function.parameters.push_back(ReadParameter(*par));
  }
  return function;
}

auto ConfigReader::ReadObject(const toml::table& table) -> ObjectConfig {
  ValidateKeys(
      table,
      {"name", "conversion_type", "ref_mode", "final_type", "trait",
       "function"},
      "object entry");
  ObjectConfig object;
  auto name = Optional<std::string>(table, "name", "a string");
  if (!name) {
    Fail(table, "object entry needs a 'name'");
  }
  object.name = *name;

  if (auto text = Optional<std::string>(table, "conversion_type", "a string")) {
    object.conversion_type = analysis::ParseConversionType(*text);
    if (!object.conversion_type) {
      Fail(
          *table.get("conversion_type"),
          fmt::format("unknown conversion type '{}'", *text));
    }
  }
  if (auto text = Optional<std::string>(table, "ref_mode", "a string")) {
    object.ref_mode = analysis::ParseRefMode(*text);
    if (!object.ref_mode) {
      Fail(*table.get("ref_mode"), fmt::format("unknown ref mode '{}'", *text));
    }
  }
  object.final_type = Optional<bool>(table, "final_type", "a boolean");
  object.generate_trait =
      Optional<bool>(table, "trait", "a boolean").value_or(true);
  for (const toml::table* function : Tables(table, "function")) {
    object.functions.push_back(ReadFunction(*function));
  }
  return object;
}

auto ConfigReader::Read(const toml::table& root) -> Config {
  ValidateKeys(root, {"object", "function"}, "configuration root");
  Config config;
  for (const toml::table* table : Tables(root, "object")) {
    auto object = ReadObject(*table);
    if (config.objects.contains(object.name)) {
      Fail(*table, fmt::format("object '{}' configured twice", object.name));
    }
    auto name = object.name;
    config.objects.emplace(std::move(name), std::move(object));
  }
  for (const toml::table* table : Tables(root, "function")) {
    config.functions.push_back(ReadFunction(*table));
  }
  return config;
}

}  // namespace

auto Ident::Name(std::string name) -> Ident {
  Ident ident;
  ident.text_ = std::move(name);
  return ident;
}

auto Ident::Pattern(std::string pattern) -> Result<Ident> {
  Ident ident;
  try {
    ident.pattern_ = std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("invalid pattern '{}': {}", pattern, e.what())));
  }
  ident.text_ = std::move(pattern);
  return ident;
}

auto Ident::Matches(std::string_view name) const -> bool {
  if (pattern_) {
    return std::regex_search(name.begin(), name.end(), *pattern_);
  }
  return text_ == name;
}

auto Config::FindObject(std::string_view name) const -> const ObjectConfig* {
  auto it = objects.find(name);
  if (it == objects.end()) {
    return nullptr;
  }
  return &it->second;
}

auto MatchedFunctions(std::span<const FunctionConfig> functions,
                      std::string_view name)
    -> std::vector<const FunctionConfig*> {
  std::vector<const FunctionConfig*> result;
  for (const FunctionConfig& function : functions) {
    if (function.ident.Matches(name)) {
      result.push_back(&function);
    }
  }
  return result;
}

auto MatchedParameters(
    std::span<const FunctionConfig* const> functions, std::string_view name)
    -> std::vector<const ParameterConfig*> {
  std::vector<const ParameterConfig*> result;
  for (const FunctionConfig* function : functions) {
    for (const ParameterConfig& par : function->parameters) {
      if (par.ident.Matches(name)) {
        result.push_back(&par);
      }
    }
  }
  return result;
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "weft.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(std::string_view text, std::string_view origin)
    -> Result<Config> {
  toml::table root;
  try {
    root = toml::parse(text, origin);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            FileLocation{
                .file = std::string(origin),
                .line = static_cast<uint32_t>(e.source().begin.line)},
            fmt::format("failed to parse configuration: {}", e.description())));
  }

  try {
    ConfigReader reader{std::string(origin)};
    return reader.Read(root);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<Config> {
  toml::table root;
  try {
    root = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            FileLocation{
                .file = config_path.string(),
                .line = static_cast<uint32_t>(e.source().begin.line)},
            fmt::format("failed to parse {}: {}", config_path.string(),
                        e.description())));
  }

  try {
    ConfigReader reader{config_path.string()};
    Config config = reader.Read(root);
    config.root_dir = config_path.parent_path();
    spdlog::debug(
        "loaded {}: {} objects, {} free function entries",
        config_path.string(), config.objects.size(), config.functions.size());
    return config;
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
}

auto ToString(StringType type) -> const char* {
  switch (type) {
    case StringType::kUtf8:
      return "utf8";
    case StringType::kFilename:
      return "filename";
    case StringType::kOsString:
      return "os_string";
  }
  return "utf8";
}

}  // namespace weft::config
