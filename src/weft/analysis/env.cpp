#include "weft/analysis/env.hpp"

#include "weft/config/config.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

auto Env::FindObjectConfig(library::TypeId id) const
    -> const config::ObjectConfig* {
  const std::string& name = TypeOf(id).Name();
  if (name.empty()) {
    return nullptr;
  }
  return config->FindObject(name);
}

auto Env::IsFinalType(library::TypeId id) const -> bool {
  if (const auto* object = FindObjectConfig(id)) {
    if (object->final_type) {
      return *object->final_type;
    }
  }
  return TypeOf(id).IsFinalType();
}

}  // namespace weft::analysis
