#pragma once

#include <filesystem>
#include <string_view>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/library/library.hpp"

namespace weft::library {

// Load a YAML library manifest: the namespace, its named types and its
// functions with fully described parameters. Returns a host error on
// malformed YAML, unknown keys, unknown type names or bad indices.
auto LoadManifest(const std::filesystem::path& path) -> Result<Library>;

// Same as LoadManifest, reading from a string. `origin` names the input in
// diagnostics.
auto ParseManifest(std::string_view text, std::string_view origin)
    -> Result<Library>;

}  // namespace weft::library
