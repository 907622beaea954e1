#include "input.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "argparse/argparse.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/config/config.hpp"
#include "weft/library/library.hpp"
#include "weft/library/manifest_loader.hpp"

namespace weft::driver {

namespace fs = std::filesystem;

void AddInputFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--config")
      .help("Configuration file (default: nearest weft.toml)")
      .metavar("path");
  cmd.add_argument("manifest").help("Library manifest (YAML)");
}

auto LoadInput(
    const fs::path& manifest, const std::optional<fs::path>& config_path)
    -> Result<AnalysisInput> {
  auto library = library::LoadManifest(manifest);
  if (!library) {
    return std::unexpected(std::move(library.error()));
  }

  std::optional<fs::path> found = config_path;
  if (!found) {
    found = config::FindConfig();
  }

  config::Config config;
  if (found) {
    auto loaded = config::LoadConfig(*found);
    if (!loaded) {
      return std::unexpected(std::move(loaded.error()));
    }
    config = std::move(*loaded);
  } else {
    spdlog::debug("no weft.toml found, using the default configuration");
  }

  return AnalysisInput{
      .library = std::move(*library),
      .config = std::move(config),
  };
}

auto PrepareInput(const argparse::ArgumentParser& cmd)
    -> Result<AnalysisInput> {
  std::optional<fs::path> config_path;
  if (auto path = cmd.present<std::string>("--config")) {
    config_path = fs::path(*path);
  }
  return LoadInput(fs::path(cmd.get<std::string>("manifest")), config_path);
}

}  // namespace weft::driver
