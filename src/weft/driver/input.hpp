#pragma once

#include <argparse/argparse.hpp>
#include <filesystem>
#include <optional>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/config/config.hpp"
#include "weft/library/library.hpp"

namespace weft::driver {

struct AnalysisInput {
  library::Library library;
  config::Config config;
};

// Add --config and the manifest positional to a subcommand.
void AddInputFlags(argparse::ArgumentParser& cmd);

// Load the manifest and the configuration. Without an explicit config path,
// weft.toml is searched upwards from the working directory; when none is
// found the default (empty) configuration is used.
auto LoadInput(
    const std::filesystem::path& manifest,
    const std::optional<std::filesystem::path>& config_path)
    -> Result<AnalysisInput>;

// LoadInput driven by the flags added by AddInputFlags.
auto PrepareInput(const argparse::ArgumentParser& cmd)
    -> Result<AnalysisInput>;

}  // namespace weft::driver
