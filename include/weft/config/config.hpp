#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "weft/analysis/conversion_type.hpp"
#include "weft/analysis/ref_mode.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"

namespace weft::config {

enum class StringType : uint8_t {
  kUtf8,
  kFilename,
  kOsString,
};

// Selects functions or parameters either by exact name or by regular
// expression (searched, not fully matched).
class Ident {
 public:
  static auto Name(std::string name) -> Ident;
  static auto Pattern(std::string pattern) -> Result<Ident>;

  [[nodiscard]] auto Matches(std::string_view name) const -> bool;

  // Source spelling, for diagnostics.
  [[nodiscard]] auto Text() const -> const std::string& {
    return text_;
  }

 private:
  std::string text_;
  std::optional<std::regex> pattern_;
};

struct ParameterConfig {
  Ident ident;
  std::optional<bool> nullable;
  bool constant = false;
  std::optional<std::string> length_of;
  std::optional<StringType> string_type;
};

struct FunctionConfig {
  Ident ident;
  bool disable_length_detect = false;
  std::vector<ParameterConfig> parameters;
};

struct ObjectConfig {
  std::string name;  // Full dotted type name
  std::optional<analysis::ConversionType> conversion_type;
  std::optional<analysis::RefMode> ref_mode;
  std::optional<bool> final_type;
  bool generate_trait = true;
  std::vector<FunctionConfig> functions;
};

struct Config {
  absl::flat_hash_map<std::string, ObjectConfig> objects;

  // Entries for free functions.
  std::vector<FunctionConfig> functions;

  // Directory where weft.toml was found; empty for the default config.
  std::filesystem::path root_dir;

  [[nodiscard]] auto FindObject(std::string_view name) const
      -> const ObjectConfig*;
};

// Function entries whose ident matches `name`, in declaration order.
auto MatchedFunctions(std::span<const FunctionConfig> functions,
                      std::string_view name)
    -> std::vector<const FunctionConfig*>;

// Parameter entries of the given functions whose ident matches `name`, in
// declaration order.
auto MatchedParameters(
    std::span<const FunctionConfig* const> functions, std::string_view name)
    -> std::vector<const ParameterConfig*>;

// Search for weft.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse weft.toml file.
// Returns error Diagnostic on parse errors or invalid fields.
auto LoadConfig(const std::filesystem::path& config_path) -> Result<Config>;

// Same as LoadConfig, reading from a string. `origin` names the input in
// diagnostics.
auto ParseConfig(std::string_view text, std::string_view origin)
    -> Result<Config>;

auto ToString(StringType type) -> const char*;

}  // namespace weft::config
